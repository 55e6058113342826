/**
 * @file affiliation.cpp
 * @brief Affiliation vocabulary lookup.
 */

#include <doves/affiliation.hpp>

namespace doves {

std::optional<Affiliation> find_affiliation(std::string_view code) noexcept {
    for (const auto& entry : AFFILIATIONS) {
        if (entry.code == code) {
            return entry.value;
        }
    }
    return std::nullopt;
}

std::vector<Affiliation> AffiliationSet::values() const {
    std::vector<Affiliation> out;
    out.reserve(size());
    for (std::size_t i = 0; i < AFFILIATION_COUNT; ++i) {
        if (bits_.test(i)) {
            out.push_back(static_cast<Affiliation>(i));
        }
    }
    return out;
}

} // namespace doves
