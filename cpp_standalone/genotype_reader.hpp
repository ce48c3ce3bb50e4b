// PLINK binary fileset reader
//
// Reads {prefix}.bim, {prefix}.fam and {prefix}.bed into a marker table,
// a sample table and the decoded genotype matrix. The i column of both tables
// indexes the matrix: bed(bim.i(k), fam.i(j)).

#ifndef GENOTYPE_READER_HPP
#define GENOTYPE_READER_HPP

#include <string>

#include "bed_format.hpp"
#include "bed_codec.hpp"
#include "genotype_matrix.hpp"
#include "plink_tables.hpp"

namespace PLINK {

struct PlinkFiles {
    std::string bedFile;
    std::string bimFile;
    std::string famFile;
};

struct PlinkData {
    MarkerTable bim;     // sorted by (chrom, pos)
    SampleTable fam;     // sorted by (fid, iid)
    GenotypeMatrix bed;  // (nMarkers x nSamples)
};

// {prefix}.bed, {prefix}.bim, {prefix}.fam
PlinkFiles plinkFileNames(const std::string& t_prefix);

// t_verbose only switches progress/timing output on std::cout
PlinkData readPlink(const std::string& t_prefix, bool t_verbose = true);

} // namespace PLINK

#endif
