// Test harness for the .bed payload decoder
// Byte table, literal decodes, padding, truncation, layout invariance

#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <armadillo>
#include "bed_codec.hpp"
#include "test_helpers.hpp"

using PLINK::BedOrientation;

// zero the padding bits of the last byte of every physical row
static std::vector<unsigned char> maskPadding(std::vector<unsigned char> t_payload,
                                              arma::uword t_nRows, arma::uword t_nCols)
{
    arma::uword numBytesofEachRow = PLINK::bytesPerRow(t_nCols);
    arma::uword nTail = t_nCols % 4;
    if (nTail == 0) {
        return t_payload;
    }
    unsigned char keep = (unsigned char)((1u << (2 * nTail)) - 1);
    for (arma::uword r = 0; r < t_nRows; r++) {
        t_payload[r * numBytesofEachRow + numBytesofEachRow - 1] &= keep;
    }
    return t_payload;
}

int main() {
    const std::string path = "synthetic.bed";
    std::mt19937 rng(20210314);

    // Test 1: byte table
    {
        const unsigned char (&table)[256][4] = PLINK::bedByteTable();
        std::cout << "table_0xD8: " << (int)table[0xD8][0] << " " << (int)table[0xD8][1] << " "
                  << (int)table[0xD8][2] << " " << (int)table[0xD8][3] << std::endl;
        checkResult("table_0b11011000",
                    table[0xD8][0] == 2 && table[0xD8][1] == 1 &&
                    table[0xD8][2] == 3 && table[0xD8][3] == 0);
        checkResult("table_0x00_all_hom_first", table[0x00][0] == 2 && table[0x00][3] == 2);
        checkResult("table_0xFF_all_hom_second", table[0xFF][0] == 0 && table[0xFF][3] == 0);
        checkResult("table_0x55_all_missing",
                    table[0x55][0] == PLINK::GENO_MISSING && table[0x55][3] == PLINK::GENO_MISSING);
        checkResult("table_0xAA_all_het", table[0xAA][0] == 1 && table[0xAA][3] == 1);

        bool allMatch = true;
        for (int b = 0; b < 256; b++) {
            for (int k = 0; k < 4; k++) {
                int code = (b >> (2 * k)) & 0x3;
                if (table[b][k] != PLINK::BED_CODE_TO_GENO[code]) {
                    allMatch = false;
                }
            }
        }
        checkResult("table_all_256_entries", allMatch);
    }

    // Test 2: sizes
    {
        checkResult("bytes_per_row",
                    PLINK::bytesPerRow(0) == 0 && PLINK::bytesPerRow(1) == 1 &&
                    PLINK::bytesPerRow(4) == 1 && PLINK::bytesPerRow(5) == 2 &&
                    PLINK::bytesPerRow(8) == 2 && PLINK::bytesPerRow(9) == 3);
        checkResult("expected_size_snp_major",
                    PLINK::expectedPayloadSize(5, 3, BedOrientation::SNP_MAJOR) == 5);
        checkResult("expected_size_individual_major",
                    PLINK::expectedPayloadSize(5, 3, BedOrientation::INDIVIDUAL_MAJOR) == 6);
    }

    // Test 3: 5 markers x 3 samples, snp-major, one byte per marker
    //   0b11011000 -> codes 00 10 01 (11 is padding) -> 2 1 3
    std::vector<unsigned char> payload53 = {
        0xD8,   // 0b11011000
        0x00,   // 0b00000000
        0x3F,   // 0b00111111
        0x67,   // 0b01100111
        0x99    // 0b10011001
    };
    arma::Mat<unsigned char> expected53 = {
        {2, 1, 3},
        {2, 2, 2},
        {0, 0, 0},
        {0, 3, 1},
        {3, 1, 3}
    };
    {
        PLINK::GenotypeMatrix g = PLINK::decodeBedPayload(payload53.data(), payload53.size(),
                                                          5, 3, BedOrientation::SNP_MAJOR, path);
        checkResult("literal_shape", g.nMarkers() == 5 && g.nSamples() == 3);
        bool ok = true;
        for (arma::uword m = 0; m < 5; m++) {
            for (arma::uword s = 0; s < 3; s++) {
                if (g(m, s) != expected53(m, s)) {
                    std::cout << "  mismatch at (" << m << ", " << s << "): "
                              << (int)g(m, s) << " vs " << (int)expected53(m, s) << std::endl;
                    ok = false;
                }
            }
        }
        checkResult("literal_5x3_snp_major", ok);
        checkResult("literal_row0", g(0, 0) == 2 && g(0, 1) == 1 && g(0, 2) == 3);
        checkResult("literal_missing_is_sentinel", g.isMissing(0, 2) && !g.isMissing(2, 0));
    }

    // Test 4: padding bits never reach the matrix
    {
        std::vector<unsigned char> flipped = payload53;
        for (unsigned char& b : flipped) {
            b ^= 0xC0;   // column 3 is padding for 3 samples
        }
        PLINK::GenotypeMatrix g = PLINK::decodeBedPayload(flipped.data(), flipped.size(),
                                                          5, 3, BedOrientation::SNP_MAJOR, path);
        checkResult("padding_bits_ignored", sameMat(g.toMat(), expected53));
    }

    // Test 5: one byte short -> TruncatedFile, extra bytes ignored
    {
        checkResult("truncated_by_one_byte",
                    throwsAs<PLINK::TruncatedFile>([&]() {
                        PLINK::decodeBedPayload(payload53.data(), payload53.size() - 1,
                                                5, 3, BedOrientation::SNP_MAJOR, path);
                    }));
        checkResult("truncated_individual_major",
                    throwsAs<PLINK::TruncatedFile>([&]() {
                        // needs 3 rows of 2 bytes
                        PLINK::decodeBedPayload(payload53.data(), payload53.size(),
                                                5, 3, BedOrientation::INDIVIDUAL_MAJOR, path);
                    }));

        std::vector<unsigned char> longer = payload53;
        longer.push_back(0x12);
        longer.push_back(0x34);
        PLINK::GenotypeMatrix g = PLINK::decodeBedPayload(longer.data(), longer.size(),
                                                          5, 3, BedOrientation::SNP_MAJOR, path);
        checkResult("trailing_bytes_ignored", sameMat(g.toMat(), expected53));

        std::string message;
        try {
            PLINK::decodeBedPayload(payload53.data(), 2, 5, 3, BedOrientation::SNP_MAJOR,
                                    "/data/cohort.bed");
        } catch (const PLINK::TruncatedFile& e) {
            message = e.what();
        }
        std::cout << "truncated_message: " << message << std::endl;
        checkResult("truncated_message_has_path", message.find("/data/cohort.bed") != std::string::npos);

        int nShort = 0;
        int nShapes = 0;
        for (arma::uword nMarkers = 1; nMarkers <= 9; nMarkers += 2) {
            for (arma::uword nSamples = 1; nSamples <= 10; nSamples += 3) {
                for (BedOrientation o : {BedOrientation::SNP_MAJOR, BedOrientation::INDIVIDUAL_MAJOR}) {
                    std::vector<unsigned char> buf(PLINK::expectedPayloadSize(nMarkers, nSamples, o), 0);
                    nShapes++;
                    if (throwsAs<PLINK::TruncatedFile>([&]() {
                            PLINK::decodeBedPayload(buf.data(), buf.size() - 1, nMarkers, nSamples, o, path);
                        })) {
                        nShort++;
                    }
                }
            }
        }
        checkResult("truncated_by_one_byte_all_shapes", nShort == nShapes);
    }

    // Test 6: empty matrices
    {
        PLINK::GenotypeMatrix noMarkers =
            PLINK::decodeBedPayload(nullptr, 0, 0, 7, BedOrientation::SNP_MAJOR, path);
        checkResult("zero_markers", noMarkers.nMarkers() == 0 && noMarkers.nSamples() == 7);

        PLINK::GenotypeMatrix noSamples =
            PLINK::decodeBedPayload(nullptr, 0, 4, 0, BedOrientation::INDIVIDUAL_MAJOR, path);
        checkResult("zero_samples", noSamples.nMarkers() == 4 && noSamples.nSamples() == 0);
    }

    // Test 7: decode then re-encode gives back the packed bytes (padding masked)
    {
        std::uniform_int_distribution<int> byteDist(0, 255);
        int nRoundTrips = 0;
        int nOk = 0;
        for (arma::uword nMarkers : {1, 3, 4, 5, 13}) {
            for (arma::uword nSamples : {1, 2, 4, 7, 8, 9}) {
                for (BedOrientation o : {BedOrientation::SNP_MAJOR, BedOrientation::INDIVIDUAL_MAJOR}) {
                    arma::uword nRows = PLINK::physicalRows(nMarkers, nSamples, o);
                    arma::uword nCols = PLINK::physicalCols(nMarkers, nSamples, o);
                    std::vector<unsigned char> raw(PLINK::expectedPayloadSize(nMarkers, nSamples, o));
                    for (unsigned char& b : raw) {
                        b = (unsigned char)byteDist(rng);
                    }

                    PLINK::GenotypeMatrix g =
                        PLINK::decodeBedPayload(raw.data(), raw.size(), nMarkers, nSamples, o, path);
                    std::vector<unsigned char> repacked = packBedPayload(g.toMat(), o);

                    nRoundTrips++;
                    if (repacked == maskPadding(raw, nRows, nCols)) {
                        nOk++;
                    }
                }
            }
        }
        std::cout << "round_trips: " << nOk << "/" << nRoundTrips << std::endl;
        checkResult("decode_encode_round_trip", nOk == nRoundTrips);
    }

    // Test 8: same logical matrix stored in both layouts decodes identically
    {
        std::uniform_int_distribution<int> genoDist(0, 3);
        bool ok = true;
        for (arma::uword nMarkers : {1, 6, 11}) {
            for (arma::uword nSamples : {1, 3, 8, 10}) {
                arma::Mat<unsigned char> logical(nMarkers, nSamples);
                for (arma::uword k = 0; k < logical.n_elem; k++) {
                    logical[k] = (unsigned char)genoDist(rng);
                }

                std::vector<unsigned char> snp = packBedPayload(logical, BedOrientation::SNP_MAJOR);
                std::vector<unsigned char> ind = packBedPayload(logical, BedOrientation::INDIVIDUAL_MAJOR);
                PLINK::GenotypeMatrix gs = PLINK::decodeBedPayload(snp.data(), snp.size(), nMarkers,
                                                                   nSamples, BedOrientation::SNP_MAJOR, path);
                PLINK::GenotypeMatrix gi = PLINK::decodeBedPayload(ind.data(), ind.size(), nMarkers,
                                                                   nSamples, BedOrientation::INDIVIDUAL_MAJOR, path);

                if (!sameMat(gs.toMat(), logical) || !sameMat(gi.toMat(), logical)) {
                    ok = false;
                }
                for (arma::uword m = 0; m < nMarkers; m++) {
                    for (arma::uword s = 0; s < nSamples; s++) {
                        if (gs(m, s) != gi(m, s)) {
                            ok = false;
                        }
                    }
                }
            }
        }
        checkResult("layout_invariance", ok);
    }

    return reportFailures();
}
