// PLINK .bed header validation

#include "bed_format.hpp"

#include <fstream>

namespace PLINK {

std::string orientationName(BedOrientation t_orientation)
{
    if (t_orientation == BedOrientation::SNP_MAJOR) {
        return "snp-major";
    }
    return "individual-major";
}

// ============================================================
// parseBedHeader: magic number check + layout byte
// ============================================================
BedOrientation parseBedHeader(const unsigned char* t_header,
                              const std::string& t_path)
{
    if (t_header[0] != BED_MAGIC_1 || t_header[1] != BED_MAGIC_2) {
        throw InvalidFormat("Invalid BED file: " + t_path +
                            " (magic number is not 0x6c 0x1b).");
    }

    if (t_header[2] == 1) {
        return BedOrientation::SNP_MAJOR;
    }
    if (t_header[2] == 0) {
        return BedOrientation::INDIVIDUAL_MAJOR;
    }

    throw InvalidFormat("Couldn't understand matrix layout of BED file: " + t_path +
                        " (unrecognized matrix layout byte " +
                        std::to_string((int)t_header[2]) + ").");
}

BedOrientation readBedHeader(std::istream& t_in, const std::string& t_path)
{
    unsigned char header[BED_HEADER_SIZE];
    t_in.read(reinterpret_cast<char*>(header), BED_HEADER_SIZE);
    if ((uint64_t)t_in.gcount() != BED_HEADER_SIZE) {
        throw InvalidFormat("Invalid BED file: " + t_path +
                            " (file is shorter than the 3-byte header).");
    }
    return parseBedHeader(header, t_path);
}

BedOrientation checkBedHeader(const std::string& t_bedFile)
{
    std::ifstream bed(t_bedFile, std::ios::in | std::ios::binary);
    if (!bed.is_open()) {
        throw std::runtime_error("Cannot open PLINK .bed file: " + t_bedFile);
    }
    return readBedHeader(bed, t_bedFile);
}

} // namespace PLINK
