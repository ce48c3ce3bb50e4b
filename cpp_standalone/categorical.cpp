// Categorical string column

#include "categorical.hpp"

void CategoricalColumn::push(const std::string& t_value)
{
    auto it = m_codeOf.find(t_value);
    if (it == m_codeOf.end()) {
        uint32_t code = (uint32_t)m_categories.size();
        m_categories.push_back(t_value);
        m_codeOf.emplace(t_value, code);
        m_codes.push_back(code);
    } else {
        m_codes.push_back(it->second);
    }
}

bool CategoricalColumn::findCode(const std::string& t_value, uint32_t& t_code) const
{
    auto it = m_codeOf.find(t_value);
    if (it == m_codeOf.end()) {
        return false;
    }
    t_code = it->second;
    return true;
}

void CategoricalColumn::permute(const std::vector<std::size_t>& t_order)
{
    std::vector<uint32_t> codes(t_order.size());
    for (std::size_t k = 0; k < t_order.size(); k++) {
        codes[k] = m_codes[t_order[k]];
    }
    m_codes.swap(codes);
}
