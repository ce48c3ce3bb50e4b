// PLINK .bim / .fam metadata tables

#include "plink_tables.hpp"
#include "bed_format.hpp"
#include "UTIL.hpp"

#include <algorithm>
#include <fstream>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace PLINK {

static const std::size_t NUM_BIM_COLUMNS = 6;
static const std::size_t NUM_FAM_COLUMNS = 6;

// ============================================================
// Helpers
// ============================================================
template <typename T>
static void permuteVec(std::vector<T>& t_vec, const std::vector<std::size_t>& t_order)
{
    std::vector<T> out;
    out.reserve(t_order.size());
    for (std::size_t k = 0; k < t_order.size(); k++) {
        out.push_back(std::move(t_vec[t_order[k]]));
    }
    t_vec.swap(out);
}

static bool isPermutation(const std::vector<uint32_t>& t_index)
{
    std::vector<bool> seen(t_index.size(), false);
    for (uint32_t idx : t_index) {
        if (idx >= t_index.size() || seen[idx]) {
            return false;
        }
        seen[idx] = true;
    }
    return true;
}

static std::string lineContext(const std::string& t_file, uint64_t t_lineNum)
{
    return t_file + " line " + std::to_string(t_lineNum);
}

static double parseDouble(const std::string& t_token, const std::string& t_column,
                          const std::string& t_file, uint64_t t_lineNum)
{
    std::size_t used = 0;
    double value = 0;
    try {
        value = std::stod(t_token, &used);
    } catch (const std::invalid_argument&) {
        used = 0;
    } catch (const std::out_of_range&) {
        throw MetadataError("Value of column '" + t_column + "' out of range ('" +
                            t_token + "') at " + lineContext(t_file, t_lineNum));
    }
    if (used == 0 || used != t_token.size()) {
        throw MetadataError("Non-numeric value of column '" + t_column + "' ('" +
                            t_token + "') at " + lineContext(t_file, t_lineNum));
    }
    return value;
}

static int64_t parseInt64(const std::string& t_token, const std::string& t_column,
                          const std::string& t_file, uint64_t t_lineNum)
{
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(t_token, &used);
    } catch (const std::invalid_argument&) {
        used = 0;
    } catch (const std::out_of_range&) {
        throw MetadataError("Value of column '" + t_column + "' out of range ('" +
                            t_token + "') at " + lineContext(t_file, t_lineNum));
    }
    if (used == 0 || used != t_token.size()) {
        throw MetadataError("Non-integer value of column '" + t_column + "' ('" +
                            t_token + "') at " + lineContext(t_file, t_lineNum));
    }
    return (int64_t)value;
}

// ============================================================
// MarkerTable
// ============================================================
void MarkerTable::append(const std::string& t_chrom, const std::string& t_snp,
                         double t_cm, int64_t t_pos,
                         const std::string& t_a0, const std::string& t_a1)
{
    m_i.push_back((uint32_t)m_i.size());
    m_chrom.push(t_chrom);
    m_snp.push_back(t_snp);
    m_cm.push_back(t_cm);
    m_pos.push_back(t_pos);
    m_a0.push(t_a0);
    m_a1.push(t_a1);
}

MarkerRecord MarkerTable::row(std::size_t t_row) const
{
    MarkerRecord rec;
    rec.chrom = m_chrom[t_row];
    rec.snp = m_snp[t_row];
    rec.cm = m_cm[t_row];
    rec.pos = m_pos[t_row];
    rec.a0 = m_a0[t_row];
    rec.a1 = m_a1[t_row];
    rec.i = m_i[t_row];
    return rec;
}

void MarkerTable::sortByPosition()
{
    std::vector<std::size_t> order(size());
    std::iota(order.begin(), order.end(), 0);

    std::stable_sort(order.begin(), order.end(),
                     [this](std::size_t a, std::size_t b) {
        const std::string& ca = m_chrom[a];
        const std::string& cb = m_chrom[b];
        if (ca != cb) {
            return ca < cb;
        }
        return m_pos[a] < m_pos[b];
    });

    m_chrom.permute(order);
    permuteVec(m_snp, order);
    permuteVec(m_cm, order);
    permuteVec(m_pos, order);
    m_a0.permute(order);
    m_a1.permute(order);
    permuteVec(m_i, order);
}

arma::uvec MarkerTable::indexOfChrom(const std::string& t_chrom) const
{
    uint32_t code;
    if (!m_chrom.findCode(t_chrom, code)) {
        return arma::uvec();
    }

    std::vector<arma::uword> index;
    for (std::size_t k = 0; k < size(); k++) {
        if (m_chrom.code(k) == code) {
            index.push_back(m_i[k]);
        }
    }
    return arma::uvec(index);
}

std::unordered_map<std::string, uint32_t> MarkerTable::markerNameToIndex() const
{
    std::unordered_map<std::string, uint32_t> nameMap;
    for (std::size_t k = 0; k < size(); k++) {
        nameMap[m_snp[k]] = m_i[k];
    }
    return nameMap;
}

bool MarkerTable::isPermutationIndex() const
{
    return isPermutation(m_i);
}

// ============================================================
// SampleTable
// ============================================================
void SampleTable::append(const std::string& t_fid, const std::string& t_iid,
                         const std::string& t_father, const std::string& t_mother,
                         const std::string& t_gender, const std::string& t_trait)
{
    m_i.push_back((uint32_t)m_i.size());
    m_fid.push_back(t_fid);
    m_iid.push_back(t_iid);
    m_father.push_back(t_father);
    m_mother.push_back(t_mother);
    m_gender.push(t_gender);
    m_trait.push_back(t_trait);
}

SampleRecord SampleTable::row(std::size_t t_row) const
{
    SampleRecord rec;
    rec.fid = m_fid[t_row];
    rec.iid = m_iid[t_row];
    rec.father = m_father[t_row];
    rec.mother = m_mother[t_row];
    rec.gender = m_gender[t_row];
    rec.trait = m_trait[t_row];
    rec.i = m_i[t_row];
    return rec;
}

void SampleTable::sortById()
{
    std::vector<std::size_t> order(size());
    std::iota(order.begin(), order.end(), 0);

    std::stable_sort(order.begin(), order.end(),
                     [this](std::size_t a, std::size_t b) {
        if (m_fid[a] != m_fid[b]) {
            return m_fid[a] < m_fid[b];
        }
        return m_iid[a] < m_iid[b];
    });

    permuteVec(m_fid, order);
    permuteVec(m_iid, order);
    permuteVec(m_father, order);
    permuteVec(m_mother, order);
    m_gender.permute(order);
    permuteVec(m_trait, order);
    permuteVec(m_i, order);
}

std::unordered_map<std::string, uint32_t> SampleTable::sampleIDToIndex() const
{
    std::unordered_map<std::string, uint32_t> idMap;
    for (std::size_t k = 0; k < size(); k++) {
        idMap[m_iid[k]] = m_i[k];
    }
    return idMap;
}

bool SampleTable::isPermutationIndex() const
{
    return isPermutation(m_i);
}

// ============================================================
// readBimFile: parse the .bim file
// ============================================================
MarkerTable readBimFile(const std::string& t_bimFile)
{
    std::ifstream bim(t_bimFile);
    if (!bim.is_open()) {
        throw std::runtime_error("Cannot open PLINK .bim file: " + t_bimFile);
    }

    MarkerTable table;
    std::string line;
    uint64_t lineNum = 0;

    while (getline(bim, line)) {
        lineNum++;
        removeTrailingCR(line);
        std::vector<std::string> line_elements = splitLine(line);
        if (line_elements.empty()) {
            continue;
        }

        if (line_elements.size() != NUM_BIM_COLUMNS) {
            throw MetadataError(
                "PLINK .bim file should have 6 columns (chrom snp cm pos a0 a1) but has " +
                std::to_string(line_elements.size()) + " at " +
                lineContext(t_bimFile, lineNum));
        }

        double cm = parseDouble(line_elements[2], "cm", t_bimFile, lineNum);
        int64_t pos = parseInt64(line_elements[3], "pos", t_bimFile, lineNum);

        table.append(line_elements[0], line_elements[1], cm, pos,
                     line_elements[4], line_elements[5]);
    }

    if (bim.bad()) {
        throw std::runtime_error("Error while reading PLINK .bim file: " + t_bimFile);
    }

    return table;
}

// ============================================================
// readFamFile: parse the .fam file
// ============================================================
SampleTable readFamFile(const std::string& t_famFile)
{
    std::ifstream fam(t_famFile);
    if (!fam.is_open()) {
        throw std::runtime_error("Cannot open PLINK .fam file: " + t_famFile);
    }

    SampleTable table;
    std::string line;
    uint64_t lineNum = 0;

    while (getline(fam, line)) {
        lineNum++;
        removeTrailingCR(line);
        std::vector<std::string> line_elements = splitLine(line);
        if (line_elements.empty()) {
            continue;
        }

        if (line_elements.size() != NUM_FAM_COLUMNS) {
            throw MetadataError(
                "PLINK .fam file should have 6 columns (fid iid father mother gender trait) but has " +
                std::to_string(line_elements.size()) + " at " +
                lineContext(t_famFile, lineNum));
        }

        table.append(line_elements[0], line_elements[1], line_elements[2],
                     line_elements[3], line_elements[4], line_elements[5]);
    }

    if (fam.bad()) {
        throw std::runtime_error("Error while reading PLINK .fam file: " + t_famFile);
    }

    return table;
}

} // namespace PLINK
