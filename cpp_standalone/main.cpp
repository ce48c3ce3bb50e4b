// PLINK binary fileset reader: command-line entry point
//
// Usage: plink_read <config.yaml>
// Reads {plinkFile}.bed/.bim/.fam, prints a summary and optionally writes
// the sorted metadata tables and the genotype matrix as text.

#include <armadillo>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "genotype_reader.hpp"
#include "UTIL.hpp"


// ============================================================
// writeMarkerInfo: sorted .bim rows with their matrix index
// ============================================================
static void writeMarkerInfo(const PLINK::MarkerTable& t_bim, const std::string& t_outFile)
{
    std::ofstream out(t_outFile);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + t_outFile);
    }
    out << std::setprecision(15);
    out << "chrom\tsnp\tcm\tpos\ta0\ta1\ti" << std::endl;
    for (std::size_t k = 0; k < t_bim.size(); k++) {
        out << t_bim.chrom(k) << "\t" << t_bim.snp(k) << "\t" << t_bim.cm(k) << "\t"
            << t_bim.pos(k) << "\t" << t_bim.a0(k) << "\t" << t_bim.a1(k) << "\t"
            << t_bim.i(k) << "\n";
    }
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + t_outFile);
    }
}

// ============================================================
// writeSampleInfo: sorted .fam rows with their matrix index
// ============================================================
static void writeSampleInfo(const PLINK::SampleTable& t_fam, const std::string& t_outFile)
{
    std::ofstream out(t_outFile);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + t_outFile);
    }
    out << "fid\tiid\tfather\tmother\tgender\ttrait\ti" << std::endl;
    for (std::size_t k = 0; k < t_fam.size(); k++) {
        out << t_fam.fid(k) << "\t" << t_fam.iid(k) << "\t" << t_fam.father(k) << "\t"
            << t_fam.mother(k) << "\t" << t_fam.gender(k) << "\t" << t_fam.trait(k) << "\t"
            << t_fam.i(k) << "\n";
    }
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + t_outFile);
    }
}

// ============================================================
// writeGenotypes: one line per marker, samples in .fam file order
// t_markerIndex selects the matrix rows (marker i values) to write
// ============================================================
static void writeGenotypes(const PLINK::PlinkData& t_data,
                           const arma::uvec& t_markerIndex,
                           const std::string& t_outFile)
{
    std::ofstream out(t_outFile);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + t_outFile);
    }

    // names in file (i) order
    std::vector<std::string> snpByIndex(t_data.bim.size());
    for (std::size_t k = 0; k < t_data.bim.size(); k++) {
        snpByIndex[t_data.bim.i(k)] = t_data.bim.snp(k);
    }
    std::vector<std::string> iidByIndex(t_data.fam.size());
    for (std::size_t k = 0; k < t_data.fam.size(); k++) {
        iidByIndex[t_data.fam.i(k)] = t_data.fam.iid(k);
    }

    out << "snp";
    for (const std::string& iid : iidByIndex) {
        out << "\t" << iid;
    }
    out << "\n";

    arma::Mat<unsigned char> geno = t_data.bed.subsetMarkers(t_markerIndex);
    for (arma::uword r = 0; r < geno.n_rows; r++) {
        out << snpByIndex[t_markerIndex[r]];
        for (arma::uword s = 0; s < geno.n_cols; s++) {
            if (geno(r, s) == PLINK::GENO_MISSING) {
                out << "\tNA";
            } else {
                out << "\t" << (int)geno(r, s);
            }
        }
        out << "\n";
    }
    if (!out) {
        throw std::runtime_error("Failed writing output file: " + t_outFile);
    }
}


// ============================================================
// main() -- CLI entry point
// ============================================================
int main(int argc, char* argv[])
{
    try {
        // ---- 1. Parse command-line ----
        if (argc < 2) {
            std::cerr << "Usage: " << argv[0] << " <config.yaml>" << std::endl;
            std::cerr << std::endl;
            std::cerr << "Read a PLINK binary fileset (.bed/.bim/.fam)" << std::endl;
            std::cerr << std::endl;
            std::cerr << "Required YAML config keys:" << std::endl;
            std::cerr << "  plinkFile:     Path to PLINK prefix (.bed/.bim/.fam)" << std::endl;
            std::cerr << std::endl;
            std::cerr << "Optional YAML config keys:" << std::endl;
            std::cerr << "  verbose:       true/false, progress and timing (default: true)" << std::endl;
            std::cerr << "  printSummary:  true/false (default: true)" << std::endl;
            std::cerr << "  outputFile:    Output prefix; writes <out>.marker_info.txt," << std::endl;
            std::cerr << "                 <out>.sample_info.txt and <out>.geno.txt (optional)" << std::endl;
            std::cerr << "  chrom:         Only write genotypes of this chromosome (optional)" << std::endl;
            return 1;
        }

        std::string configFile = argv[1];

        // ---- 2. Read YAML config ----
        YAML::Node config = YAML::LoadFile(configFile);

        if (!config["plinkFile"]) {
            throw std::runtime_error("Config missing required key: plinkFile");
        }
        std::string plinkPrefix = config["plinkFile"].as<std::string>();

        bool verbose = config["verbose"] ? config["verbose"].as<bool>() : true;
        bool printSummary = config["printSummary"] ? config["printSummary"].as<bool>() : true;
        std::string outputFile = config["outputFile"] ? config["outputFile"].as<std::string>() : "";
        std::string chrom = config["chrom"] ? config["chrom"].as<std::string>() : "";

        if (verbose) {
            std::cout << "Loading config from: " << configFile << std::endl;
            std::cout << std::endl;
            std::cout << "Configuration:" << std::endl;
            std::cout << "  plinkFile:     " << plinkPrefix << std::endl;
            std::cout << "  outputFile:    " << (outputFile.empty() ? "(none)" : outputFile) << std::endl;
            std::cout << "  chrom:         " << (chrom.empty() ? "(all)" : chrom) << std::endl;
            std::cout << "  printSummary:  " << std::boolalpha << printSummary << std::endl;
            std::cout << std::endl;
        }

        // ---- 3. Read the fileset ----
        arma::vec timeStart = getTime();
        PLINK::PlinkData data = PLINK::readPlink(plinkPrefix, verbose);
        arma::vec timeEnd = getTime();
        if (verbose) {
            printTime(timeStart, timeEnd, "reading PLINK files");
        }

        // ---- 4. Summary ----
        if (printSummary) {
            arma::uword nCells = data.bed.nMarkers() * data.bed.nSamples();
            double missingRate = nCells > 0 ? (double)data.bed.countMissing() / (double)nCells : 0.0;
            std::cout << std::endl;
            std::cout << "Summary:" << std::endl;
            std::cout << "  markers:       " << data.bed.nMarkers() << std::endl;
            std::cout << "  samples:       " << data.bed.nSamples() << std::endl;
            std::cout << "  chromosomes:   " << data.bim.chromColumn().nCategories() << std::endl;
            std::cout << "  layout:        " << PLINK::orientationName(data.bed.orientation()) << std::endl;
            std::cout << "  missing rate:  " << missingRate << std::endl;
        }

        // ---- 5. Text output ----
        if (!outputFile.empty()) {
            arma::uvec markerIndex;
            if (chrom.empty()) {
                markerIndex.set_size(data.bed.nMarkers());
                for (arma::uword m = 0; m < markerIndex.n_elem; m++) {
                    markerIndex[m] = m;
                }
            } else {
                markerIndex = data.bim.indexOfChrom(chrom);
                if (markerIndex.n_elem == 0) {
                    std::cerr << "WARNING: no markers on chromosome " << chrom << std::endl;
                }
            }

            writeMarkerInfo(data.bim, outputFile + ".marker_info.txt");
            writeSampleInfo(data.fam, outputFile + ".sample_info.txt");
            writeGenotypes(data, markerIndex, outputFile + ".geno.txt");

            if (verbose) {
                std::cout << std::endl;
                std::cout << "Wrote " << outputFile << ".marker_info.txt" << std::endl;
                std::cout << "Wrote " << outputFile << ".sample_info.txt" << std::endl;
                std::cout << "Wrote " << outputFile << ".geno.txt ("
                          << markerIndex.n_elem << " markers)" << std::endl;
            }
        }

        return 0;

    } catch (const YAML::Exception& e) {
        std::cerr << "ERROR: invalid config: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
