/**
 * @file decoder.hpp
 * @brief Per-field decoders for the Dove's Guide export encodings.
 *
 * Scalar decoders:
 * - decode_presence() - empty text is false, anything else true
 * - decode_weight()   - decimal pounds
 * - decode_pitch()    - note name plus optional accidental, empty is absent
 * - decode_unsigned() / decode_number() - plain numeric columns
 *
 * Composite decoders:
 * - decode_list()         - ';'-delimited free text, split literally
 * - decode_affiliations() - ';'-delimited organisation codes
 *
 * Decoders are pure: they read only their argument and the constant
 * affiliation table, so they may run concurrently without locking.
 */

#ifndef DOVES_DECODER_HPP
#define DOVES_DECODER_HPP

#include "affiliation.hpp"
#include "config.hpp"
#include "error.hpp"
#include "note.hpp"
#include "weight.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace doves {

/**
 * @brief Presence flag: `false` iff the raw text is empty.
 *
 * The text itself ("u/r", "GF", "T", ...) carries no further meaning.
 */
[[nodiscard]] inline bool decode_presence(std::string_view raw) noexcept {
    return !raw.empty();
}

/**
 * @brief Parse an unsigned decimal integer (digits only).
 *
 * @param raw Raw field text
 * @param[out] out Parsed value
 * @return Error::Ok, or Error::InvalidNumber
 */
Error decode_unsigned(std::string_view raw, std::uint64_t& out) noexcept;

/**
 * @brief Parse a finite decimal floating-point number.
 *
 * Uses the classic locale regardless of the process locale. Leading
 * or trailing whitespace, trailing text, infinities and NaN are rejected.
 *
 * @param raw Raw field text
 * @param[out] out Parsed value
 * @return Error::Ok, or Error::InvalidNumber
 */
Error decode_number(std::string_view raw, double& out);

/**
 * @brief Decode the weight of the heaviest bell (in pounds).
 *
 * @param raw Raw field text
 * @param[out] out Decoded weight
 * @param options Decode policy; reject_negative_weight enables Error::InvalidRange
 * @return Error::Ok, Error::InvalidNumber or Error::InvalidRange
 */
Error decode_weight(std::string_view raw, Weight& out, const DecodeOptions& options = {});

/**
 * @brief Decode an optional pitch.
 *
 * - "" -> std::nullopt
 * - first character A-G (case-sensitive) selects the note name
 * - second character: 'b' or U+266D flat; U+266E or nothing natural;
 *   '#' or U+266F sharp
 *
 * Characters after the accidental are ignored unless options.strict_pitch
 * is set, in which case they fail with Error::TrailingData.
 *
 * @param raw Raw field text (UTF-8)
 * @param[out] out Decoded pitch, or std::nullopt for empty input
 * @param options Decode policy
 * @return Error::Ok, Error::InvalidNoteName, Error::InvalidAccidental or Error::TrailingData
 */
Error decode_pitch(std::string_view raw, std::optional<Pitch>& out,
                   const DecodeOptions& options = {}) noexcept;

/**
 * @brief Split a free-text list on ';'.
 *
 * Behaves exactly like a literal split: empty segments are kept and an
 * empty input yields one empty element.
 *
 * "a;;b" -> {"a", "", "b"}, "" -> {""}
 */
std::vector<std::string> decode_list(std::string_view raw);

/**
 * @brief Decode a ';'-delimited set of affiliation codes.
 *
 * Spaces around a code are ignored, empty segments are skipped and
 * duplicate codes collapse. Empty input yields an empty set.
 *
 * @param raw Raw field text
 * @param[out] out Decoded set (left empty on error)
 * @param[out] unknown_code If non-null, receives the first code not in the vocabulary
 * @return Error::Ok, or Error::UnknownAffiliation
 */
Error decode_affiliations(std::string_view raw, AffiliationSet& out,
                          std::string_view* unknown_code = nullptr) noexcept;

} // namespace doves

#endif // DOVES_DECODER_HPP
