// PLINK binary fileset reader

#include <armadillo>
#include "genotype_reader.hpp"
#include "UTIL.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace PLINK {

PlinkFiles plinkFileNames(const std::string& t_prefix)
{
    PlinkFiles files;
    files.bedFile = t_prefix + ".bed";
    files.bimFile = t_prefix + ".bim";
    files.famFile = t_prefix + ".fam";
    return files;
}

// ============================================================
// readPlink
//
// .bim and .fam are read first; their record counts fix the
// expected size of the .bed payload.
// ============================================================
PlinkData readPlink(const std::string& t_prefix, bool t_verbose)
{
    PlinkFiles files = plinkFileNames(t_prefix);
    PlinkData data;
    arma::vec timeStart, timeEnd;

    if (t_verbose) {
        std::cout << "Reading " << files.bimFile << "..." << std::endl;
        timeStart = getTime();
    }
    data.bim = readBimFile(files.bimFile);
    uint64_t nMarkers = data.bim.size();
    if (t_verbose) {
        timeEnd = getTime();
        std::cout << "Number of markers in bim file: " << nMarkers << std::endl;
        printTime(timeStart, timeEnd, "reading " + files.bimFile);
    }

    if (t_verbose) {
        std::cout << "Reading " << files.famFile << "..." << std::endl;
        timeStart = getTime();
    }
    data.fam = readFamFile(files.famFile);
    uint64_t nSamples = data.fam.size();
    if (t_verbose) {
        timeEnd = getTime();
        std::cout << "Number of samples in fam file: " << nSamples << std::endl;
        printTime(timeStart, timeEnd, "reading " + files.famFile);
    }

    if (t_verbose) {
        std::cout << "Reading " << files.bedFile << "..." << std::endl;
        timeStart = getTime();
    }
    data.bed = readBedFile(files.bedFile, nMarkers, nSamples);
    if (t_verbose) {
        timeEnd = getTime();
        std::cout << "Matrix layout: " << orientationName(data.bed.orientation())
                  << " (" << data.bed.nMarkers() << " markers x "
                  << data.bed.nSamples() << " samples)" << std::endl;
        printTime(timeStart, timeEnd, "reading " + files.bedFile);
    }

    data.bim.sortByPosition();
    data.fam.sortById();

    if (!data.bim.isPermutationIndex() || !data.fam.isPermutationIndex()) {
        throw std::logic_error("readPlink: marker/sample index is not a permutation after sorting.");
    }

    return data;
}

} // namespace PLINK
