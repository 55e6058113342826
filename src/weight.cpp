/**
 * @file weight.cpp
 * @brief Weight unit conversions.
 */

#include <doves/weight.hpp>

#include <cmath>
#include <limits>

namespace doves {

Cwt Weight::to_cwt() const noexcept {
    if (!(lbs_ > 0.0)) {
        return {};
    }

    // 2^64, the first value std::uint64_t cannot hold
    constexpr double POUNDS_LIMIT = 18446744073709551616.0;

    const double rounded = std::floor(lbs_ + 0.5);
    std::uint64_t total = rounded >= POUNDS_LIMIT ? std::numeric_limits<std::uint64_t>::max()
                                                  : static_cast<std::uint64_t>(rounded);

    Cwt out;
    out.cwt = total / POUNDS_PER_CWT;
    total %= POUNDS_PER_CWT;
    out.qr = total / POUNDS_PER_QUARTER;
    out.lb = total % POUNDS_PER_QUARTER;
    return out;
}

std::string to_string(const Weight& weight) {
    const Cwt c = weight.to_cwt();
    return std::to_string(c.cwt) + "-" + std::to_string(c.qr) + "-" + std::to_string(c.lb);
}

} // namespace doves
