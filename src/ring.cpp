/**
 * @file ring.cpp
 * @brief Ring enumeration tags.
 */

#include <doves/ring.hpp>

namespace doves {

namespace {

constexpr std::string_view FULL_CIRCLE_TAG = "Full circle ring";
constexpr std::string_view CARILLON_TAG = "Carillon";

} // namespace

Error decode_ring_type(std::string_view raw, RingType& out) noexcept {
    if (raw == FULL_CIRCLE_TAG) {
        out = RingType::FullCircle;
    } else if (raw == CARILLON_TAG) {
        out = RingType::Carillon;
    } else {
        return Error::UnknownVariant;
    }
    return Error::Ok;
}

Error decode_details(std::string_view raw, Details& out) noexcept {
    if (raw == "P") {
        out = Details::P;
    } else if (raw == "C") {
        out = Details::C;
    } else {
        return Error::UnknownVariant;
    }
    return Error::Ok;
}

std::string_view to_string(RingType type) noexcept {
    switch (type) {
    case RingType::FullCircle:
        return FULL_CIRCLE_TAG;
    case RingType::Carillon:
        return CARILLON_TAG;
    }
    return {};
}

std::string_view to_string(Details details) noexcept {
    return details == Details::P ? "P" : "C";
}

} // namespace doves
