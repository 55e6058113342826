/**
 * @file error.cpp
 * @brief Decode error rendering.
 */

#include <doves/error.hpp>

#include <utility>

namespace doves {

std::string describe(const DecodeError& error) {
    std::string out = error.field;
    out += ": ";
    out += error_string(error.kind);
    if (!error.value.empty()) {
        out += " '";
        out += error.value;
        out += "'";
    }
    return out;
}

#if !DOVES_NO_EXCEPTIONS

namespace {

std::string summarize(const std::vector<DecodeError>& errors) {
    if (errors.empty()) {
        return "Record rejected";
    }
    std::string out = describe(errors.front());
    if (errors.size() > 1) {
        out += " (+" + std::to_string(errors.size() - 1) + " more)";
    }
    return out;
}

Error first_kind(const std::vector<DecodeError>& errors) noexcept {
    return errors.empty() ? Error::Io : errors.front().kind;
}

} // namespace

RecordException::RecordException(std::vector<DecodeError> errors)
    : DovesException(summarize(errors), first_kind(errors)), errors_(std::move(errors)) {}

#endif // !DOVES_NO_EXCEPTIONS

} // namespace doves
