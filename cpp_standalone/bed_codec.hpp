// PLINK .bed genotype payload decoder
//
// The two-bit genotype codes have the following meanings:
//   00  Homozygous for first allele in .bim file   -> 2
//   01  Missing genotype                           -> 3 (GENO_MISSING)
//   10  Heterozygous                               -> 1
//   11  Homozygous for second allele in .bim file  -> 0
// Four codes are packed per byte, least-significant pair first. Every physical
// row starts on a byte boundary; the unused high bits of its last byte are
// padding and are ignored.

#ifndef BED_CODEC_HPP
#define BED_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "bed_format.hpp"
#include "genotype_matrix.hpp"

namespace PLINK {

// genotype value for each raw 2-bit code
static const unsigned char BED_CODE_TO_GENO[4] = {2, GENO_MISSING, 1, 0};

// byte value -> the 4 genotype values it packs (256 x 4)
const unsigned char (&bedByteTable())[256][4];

inline uint64_t bytesPerRow(uint64_t t_nCols) {
    return (t_nCols + 3) / 4;
}

uint64_t physicalRows(uint64_t t_nMarkers, uint64_t t_nSamples,
                      BedOrientation t_orientation);

uint64_t physicalCols(uint64_t t_nMarkers, uint64_t t_nSamples,
                      BedOrientation t_orientation);

// bytes after the header that a (t_nMarkers x t_nSamples) matrix occupies
uint64_t expectedPayloadSize(uint64_t t_nMarkers, uint64_t t_nSamples,
                             BedOrientation t_orientation);

// Decode the bytes following the 3-byte header. Throws TruncatedFile if
// t_payloadSize is below expectedPayloadSize(); extra bytes are ignored.
GenotypeMatrix decodeBedPayload(const unsigned char* t_payload,
                                std::size_t t_payloadSize,
                                uint64_t t_nMarkers,
                                uint64_t t_nSamples,
                                BedOrientation t_orientation,
                                const std::string& t_path);

// Open t_bedFile, validate the header and decode the matrix
GenotypeMatrix readBedFile(const std::string& t_bedFile,
                           uint64_t t_nMarkers,
                           uint64_t t_nSamples);

} // namespace PLINK

#endif
