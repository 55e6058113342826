/**
 * @file error.hpp
 * @brief Dove's Guide decoder error handling.
 *
 * Decoders report failures as Error codes plus a field-scoped
 * DecodeError value. A thin exception layer is available on top for
 * callers that prefer throwing (disabled with DOVES_NO_EXCEPTIONS=1).
 */

#ifndef DOVES_ERROR_HPP
#define DOVES_ERROR_HPP

#include "config.hpp"

#include <string>
#include <vector>

#if !DOVES_NO_EXCEPTIONS
#include <stdexcept>
#endif

namespace doves {

/**
 * @brief Error codes returned by every decoder.
 */
enum class Error {
    Ok = 0,                  ///< Success
    UnknownField = -1,       ///< Field name outside the record schema
    MissingField = -2,       ///< Mandatory field absent
    InvalidNumber = -3,      ///< Value not parseable as a number
    InvalidNoteName = -4,    ///< Pitch does not start with A-G
    InvalidAccidental = -5,  ///< Pitch accidental not one of b, #, and the glyphs
    UnknownAffiliation = -6, ///< Affiliation code outside the vocabulary
    UnknownVariant = -7,     ///< Tag outside a fixed enumeration
    InvalidRange = -8,       ///< Number outside the accepted range (strict policy)
    TrailingData = -9,       ///< Unexpected characters after a value (strict policy)
    Io = -10                 ///< Malformed or unreadable input file
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::UnknownField:
        return "Unknown field";
    case Error::MissingField:
        return "Missing field";
    case Error::InvalidNumber:
        return "Invalid number";
    case Error::InvalidNoteName:
        return "Invalid note name";
    case Error::InvalidAccidental:
        return "Invalid accidental";
    case Error::UnknownAffiliation:
        return "Unknown affiliation";
    case Error::UnknownVariant:
        return "Unknown variant";
    case Error::InvalidRange:
        return "Value out of range";
    case Error::TrailingData:
        return "Trailing data";
    case Error::Io:
        return "Malformed input";
    default:
        return "Unknown error";
    }
}

/**
 * @brief A single field-scoped decode failure.
 *
 * `field` is the export header the failure belongs to; `value` is the
 * offending raw text (the field name itself for UnknownField, empty for
 * MissingField).
 */
struct DecodeError {
    Error kind = Error::Ok;
    std::string field;
    std::string value;

    friend bool operator==(const DecodeError&, const DecodeError&) = default;
};

/**
 * @brief Render a decode error as `<field>: <message> '<value>'`.
 */
std::string describe(const DecodeError& error);

#if !DOVES_NO_EXCEPTIONS

/**
 * @brief Base exception for decoder errors.
 */
class DovesException : public std::runtime_error {
public:
    explicit DovesException(const std::string& message, Error code = Error::Io)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for a record that failed assembly.
 *
 * Carries every field error collected for the record; code() is the
 * kind of the first one.
 */
class RecordException : public DovesException {
public:
    explicit RecordException(std::vector<DecodeError> errors);

    const std::vector<DecodeError>& errors() const noexcept {
        return errors_;
    }

private:
    std::vector<DecodeError> errors_;
};

/**
 * @brief Exception for unreadable or malformed export files.
 */
class IoException : public DovesException {
public:
    explicit IoException(const std::string& message) : DovesException(message, Error::Io) {}
};

#endif // !DOVES_NO_EXCEPTIONS

} // namespace doves

#endif // DOVES_ERROR_HPP
