/**
 * @file weight.hpp
 * @brief Weight of the heaviest bell of a ring.
 *
 * Stored in pounds, as published. Bell weights are traditionally quoted
 * in hundredweight, quarters and pounds (1 cwt = 4 qr = 112 lb), which
 * to_cwt() and to_string() provide.
 */

#ifndef DOVES_WEIGHT_HPP
#define DOVES_WEIGHT_HPP

#include <cstdint>
#include <string>

namespace doves {

inline constexpr double KILOGRAMS_PER_POUND = 0.45359237;
inline constexpr std::uint32_t POUNDS_PER_QUARTER = 28U;
inline constexpr std::uint32_t QUARTERS_PER_CWT = 4U;
inline constexpr std::uint32_t POUNDS_PER_CWT = POUNDS_PER_QUARTER * QUARTERS_PER_CWT;

/**
 * @brief Weight split into hundredweight, quarters and pounds.
 */
struct Cwt {
    std::uint64_t cwt = 0;
    std::uint64_t qr = 0;
    std::uint64_t lb = 0;

    friend bool operator==(const Cwt&, const Cwt&) = default;
};

/**
 * @brief A bell weight in pounds.
 */
class Weight {
public:
    Weight() noexcept = default;

    explicit Weight(double lbs) noexcept : lbs_(lbs) {}

    [[nodiscard]] double pounds() const noexcept {
        return lbs_;
    }

    [[nodiscard]] double kilograms() const noexcept {
        return lbs_ * KILOGRAMS_PER_POUND;
    }

    /**
     * @brief Convert to cwt-qr-lb, rounding to the nearest pound.
     *
     * Negative weights convert as zero; weights beyond the range of
     * std::uint64_t pounds saturate at its maximum.
     */
    [[nodiscard]] Cwt to_cwt() const noexcept;

    friend bool operator==(const Weight&, const Weight&) = default;

private:
    double lbs_ = 0.0;
};

/**
 * @brief Render as "cwt-qr-lb", e.g. "23-3-14".
 */
std::string to_string(const Weight& weight);

} // namespace doves

#endif // DOVES_WEIGHT_HPP
