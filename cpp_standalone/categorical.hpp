// Categorical string column
//
// Low-cardinality text columns (chromosome, allele codes, sex) are stored
// as a table of distinct strings plus one small integer code per row.

#ifndef CATEGORICAL_HPP
#define CATEGORICAL_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

class CategoricalColumn {
private:

    std::vector<std::string> m_categories;              // first-appearance order
    std::unordered_map<std::string, uint32_t> m_codeOf;
    std::vector<uint32_t> m_codes;                      // one per row

public:

    void push(const std::string& t_value);
    void reserve(std::size_t t_n) { m_codes.reserve(t_n); }

    std::size_t size() const { return m_codes.size(); }
    std::size_t nCategories() const { return m_categories.size(); }

    const std::string& operator[](std::size_t t_row) const {
        return m_categories[m_codes[t_row]];
    }

    uint32_t code(std::size_t t_row) const { return m_codes[t_row]; }

    const std::vector<std::string>& categories() const { return m_categories; }

    // code of t_value; false if the value never occurs
    bool findCode(const std::string& t_value, uint32_t& t_code) const;

    // reorder rows: new row k is old row t_order[k]
    void permute(const std::vector<std::size_t>& t_order);
};

#endif
