// PLINK .bed file format: header validation and error types
//
// https://www.cog-genomics.org/plink/1.9/formats#bed
// A .bed file starts with three bytes:
//   0x6c 0x1b      magic number
//   0x01 / 0x00    snp-major / individual-major matrix layout
// followed by the packed 2-bit genotype matrix.

#ifndef BED_FORMAT_HPP
#define BED_FORMAT_HPP

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>

namespace PLINK {

// Header problems: bad magic number, unknown layout byte, short header
class InvalidFormat : public std::runtime_error {
public:
    explicit InvalidFormat(const std::string& what) : std::runtime_error(what) {}
};

// Genotype payload is shorter than the .bim/.fam counts require
class TruncatedFile : public std::runtime_error {
public:
    explicit TruncatedFile(const std::string& what) : std::runtime_error(what) {}
};

// Malformed row in a .bim or .fam file
class MetadataError : public std::runtime_error {
public:
    explicit MetadataError(const std::string& what) : std::runtime_error(what) {}
};

static const unsigned char BED_MAGIC_1 = 0x6c;   // 108
static const unsigned char BED_MAGIC_2 = 0x1b;   // 27
static const uint64_t BED_HEADER_SIZE = 3;

// Physical row order of the packed matrix
enum class BedOrientation {
    INDIVIDUAL_MAJOR = 0,   // rows = samples, columns = markers
    SNP_MAJOR = 1           // rows = markers, columns = samples
};

std::string orientationName(BedOrientation t_orientation);

// Validate the 3 header bytes, return the matrix layout.
// t_path is only used in error messages.
BedOrientation parseBedHeader(const unsigned char* t_header,
                              const std::string& t_path);

// Read exactly 3 bytes from t_in and validate them
BedOrientation readBedHeader(std::istream& t_in, const std::string& t_path);

// Open t_bedFile and validate its header
BedOrientation checkBedHeader(const std::string& t_bedFile);

} // namespace PLINK

#endif
