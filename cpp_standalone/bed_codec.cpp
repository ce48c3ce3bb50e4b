// PLINK .bed genotype payload decoder

#include "bed_codec.hpp"

#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

namespace PLINK {

// ============================================================
// bedByteTable: translate all 4 genotypes of a byte at once
// bits [1:0] = column 0, [3:2] = column 1, [5:4] = column 2, [7:6] = column 3
// ============================================================
namespace {

struct BedByteTable {
    unsigned char geno[256][4];

    BedByteTable() {
        for (int b = 0; b < 256; b++) {
            for (int k = 0; k < 4; k++) {
                geno[b][k] = BED_CODE_TO_GENO[(b >> (k * 2)) & 0x03];
            }
        }
    }
};

} // namespace

const unsigned char (&bedByteTable())[256][4]
{
    static const BedByteTable table;
    return table.geno;
}

uint64_t physicalRows(uint64_t t_nMarkers, uint64_t t_nSamples,
                      BedOrientation t_orientation)
{
    return (t_orientation == BedOrientation::SNP_MAJOR) ? t_nMarkers : t_nSamples;
}

uint64_t physicalCols(uint64_t t_nMarkers, uint64_t t_nSamples,
                      BedOrientation t_orientation)
{
    return (t_orientation == BedOrientation::SNP_MAJOR) ? t_nSamples : t_nMarkers;
}

uint64_t expectedPayloadSize(uint64_t t_nMarkers, uint64_t t_nSamples,
                             BedOrientation t_orientation)
{
    return bytesPerRow(physicalCols(t_nMarkers, t_nSamples, t_orientation)) *
           physicalRows(t_nMarkers, t_nSamples, t_orientation);
}

// ============================================================
// decodeBedPayload
//
// Physical row r is decoded into column r of a (nCols x nRows)
// armadillo matrix, so output cells are written contiguously.
// ============================================================
GenotypeMatrix decodeBedPayload(const unsigned char* t_payload,
                                std::size_t t_payloadSize,
                                uint64_t t_nMarkers,
                                uint64_t t_nSamples,
                                BedOrientation t_orientation,
                                const std::string& t_path)
{
    const uint64_t nRows = physicalRows(t_nMarkers, t_nSamples, t_orientation);
    const uint64_t nCols = physicalCols(t_nMarkers, t_nSamples, t_orientation);
    const uint64_t numBytesofEachRow = bytesPerRow(nCols);
    const uint64_t expected = numBytesofEachRow * nRows;

    if ((uint64_t)t_payloadSize < expected) {
        throw TruncatedFile(
            "Truncated BED file: " + t_path + " has " +
            std::to_string(t_payloadSize) + " genotype bytes but " +
            std::to_string(nRows) + " " + orientationName(t_orientation) +
            " rows of " + std::to_string(numBytesofEachRow) +
            " bytes require " + std::to_string(expected) + ".");
    }

    const unsigned char (&table)[256][4] = bedByteTable();
    const uint64_t nFullBytes = nCols / 4;
    const uint64_t nTail = nCols % 4;

    arma::Mat<unsigned char> geno(nCols, nRows);

    for (uint64_t r = 0; r < nRows; r++) {
        const unsigned char* bufferG4 = t_payload + r * numBytesofEachRow;
        unsigned char* out = geno.colptr(r);

        for (uint64_t b = 0; b < nFullBytes; b++) {
            std::memcpy(out + 4 * b, table[bufferG4[b]], 4);
        }
        // last byte: padding bits are dropped
        if (nTail > 0) {
            std::memcpy(out + 4 * nFullBytes, table[bufferG4[nFullBytes]], nTail);
        }
    }

    return GenotypeMatrix(std::move(geno), t_orientation);
}

// ============================================================
// readBedFile: header + payload of a .bed file
// ============================================================
GenotypeMatrix readBedFile(const std::string& t_bedFile,
                           uint64_t t_nMarkers,
                           uint64_t t_nSamples)
{
    std::ifstream bed(t_bedFile, std::ios::in | std::ios::binary);
    if (!bed.is_open()) {
        throw std::runtime_error("Cannot open PLINK .bed file: " + t_bedFile);
    }

    BedOrientation orientation = readBedHeader(bed, t_bedFile);
    uint64_t expected = expectedPayloadSize(t_nMarkers, t_nSamples, orientation);

    std::vector<unsigned char> payload(expected);
    if (expected > 0) {
        bed.read(reinterpret_cast<char*>(payload.data()), (std::streamsize)expected);
        payload.resize(bed.gcount());
    }

    return decodeBedPayload(payload.data(), payload.size(),
                            t_nMarkers, t_nSamples, orientation, t_bedFile);
}

} // namespace PLINK
