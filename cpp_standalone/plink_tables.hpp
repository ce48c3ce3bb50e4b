// PLINK .bim / .fam metadata tables
//
// .bim: chrom  snp  cm  pos  a0  a1               (one marker per line)
// .fam: fid  iid  father  mother  gender  trait   (one sample per line)
// Whitespace-delimited, positional columns, no header line.
//
// Every row carries i, its 0-based position in the file. i is the row (marker)
// or column (sample) index into the genotype matrix; sorting the tables moves
// rows around but never rewrites i.

#ifndef PLINK_TABLES_HPP
#define PLINK_TABLES_HPP

#include <armadillo>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "categorical.hpp"

namespace PLINK {

struct MarkerRecord {
    std::string chrom;
    std::string snp;
    double cm;
    int64_t pos;
    std::string a0;
    std::string a1;
    uint32_t i;
};

struct SampleRecord {
    std::string fid;
    std::string iid;
    std::string father;
    std::string mother;
    std::string gender;
    std::string trait;
    uint32_t i;
};

class MarkerTable {
private:

    CategoricalColumn m_chrom;              // Chromosome code
    std::vector<std::string> m_snp;         // Variant identifier
    std::vector<double> m_cm;               // Position in centimorgans
    std::vector<int64_t> m_pos;             // Base-pair coordinate
    CategoricalColumn m_a0;                 // Allele 1 (clear bits in .bed)
    CategoricalColumn m_a1;                 // Allele 2 (set bits in .bed)
    std::vector<uint32_t> m_i;

public:

    void append(const std::string& t_chrom, const std::string& t_snp,
                double t_cm, int64_t t_pos,
                const std::string& t_a0, const std::string& t_a1);

    std::size_t size() const { return m_i.size(); }

    const std::string& chrom(std::size_t t_row) const { return m_chrom[t_row]; }
    const std::string& snp(std::size_t t_row) const { return m_snp[t_row]; }
    double cm(std::size_t t_row) const { return m_cm[t_row]; }
    int64_t pos(std::size_t t_row) const { return m_pos[t_row]; }
    const std::string& a0(std::size_t t_row) const { return m_a0[t_row]; }
    const std::string& a1(std::size_t t_row) const { return m_a1[t_row]; }
    uint32_t i(std::size_t t_row) const { return m_i[t_row]; }

    MarkerRecord row(std::size_t t_row) const;

    const CategoricalColumn& chromColumn() const { return m_chrom; }
    const CategoricalColumn& a0Column() const { return m_a0; }
    const CategoricalColumn& a1Column() const { return m_a1; }
    const std::vector<uint32_t>& indexColumn() const { return m_i; }

    // stable sort by (chrom, pos), chromosome labels compared as strings
    void sortByPosition();

    // i of every marker on t_chrom, in current row order
    arma::uvec indexOfChrom(const std::string& t_chrom) const;

    // snp name -> i
    std::unordered_map<std::string, uint32_t> markerNameToIndex() const;

    bool isPermutationIndex() const;
};

class SampleTable {
private:

    std::vector<std::string> m_fid;
    std::vector<std::string> m_iid;
    std::vector<std::string> m_father;
    std::vector<std::string> m_mother;
    CategoricalColumn m_gender;
    std::vector<std::string> m_trait;
    std::vector<uint32_t> m_i;

public:

    void append(const std::string& t_fid, const std::string& t_iid,
                const std::string& t_father, const std::string& t_mother,
                const std::string& t_gender, const std::string& t_trait);

    std::size_t size() const { return m_i.size(); }

    const std::string& fid(std::size_t t_row) const { return m_fid[t_row]; }
    const std::string& iid(std::size_t t_row) const { return m_iid[t_row]; }
    const std::string& father(std::size_t t_row) const { return m_father[t_row]; }
    const std::string& mother(std::size_t t_row) const { return m_mother[t_row]; }
    const std::string& gender(std::size_t t_row) const { return m_gender[t_row]; }
    const std::string& trait(std::size_t t_row) const { return m_trait[t_row]; }
    uint32_t i(std::size_t t_row) const { return m_i[t_row]; }

    SampleRecord row(std::size_t t_row) const;

    const CategoricalColumn& genderColumn() const { return m_gender; }
    const std::vector<uint32_t>& indexColumn() const { return m_i; }

    // stable sort by (fid, iid)
    void sortById();

    // iid -> i
    std::unordered_map<std::string, uint32_t> sampleIDToIndex() const;

    bool isPermutationIndex() const;
};

// Throw MetadataError on a malformed row, std::runtime_error if unreadable
MarkerTable readBimFile(const std::string& t_bimFile);
SampleTable readFamFile(const std::string& t_famFile);

} // namespace PLINK

#endif
