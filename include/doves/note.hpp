/**
 * @file note.hpp
 * @brief Musical pitch of the heaviest bell of a ring.
 *
 * A Pitch is a root note name (A to G) and an accidental. Naturals
 * render without a symbol, flats and sharps with the Unicode glyphs
 * U+266D and U+266F.
 */

#ifndef DOVES_NOTE_HPP
#define DOVES_NOTE_HPP

#include <ostream>
#include <string>

namespace doves {

/// UTF-8 encoding of the flat glyph (U+266D)
inline constexpr const char* FLAT_GLYPH = "\xE2\x99\xAD";
/// UTF-8 encoding of the natural glyph (U+266E)
inline constexpr const char* NATURAL_GLYPH = "\xE2\x99\xAE";
/// UTF-8 encoding of the sharp glyph (U+266F)
inline constexpr const char* SHARP_GLYPH = "\xE2\x99\xAF";

/**
 * @brief Root note name.
 */
enum class NoteName { A, B, C, D, E, F, G };

/**
 * @brief Accidental applied to a NoteName.
 */
enum class Accidental { Flat, Natural, Sharp };

/**
 * @brief Nominal note of a bell.
 */
struct Pitch {
    NoteName name = NoteName::C;
    Accidental accidental = Accidental::Natural;

    friend bool operator==(const Pitch&, const Pitch&) = default;
};

/**
 * @brief Letter of a note name ("A" to "G").
 */
std::string to_string(NoteName name);

/**
 * @brief Symbol of an accidental; empty for natural.
 */
std::string to_string(Accidental accidental);

/**
 * @brief Note name followed by its accidental symbol, e.g. "E♭".
 */
std::string to_string(const Pitch& pitch);

inline std::ostream& operator<<(std::ostream& os, const Pitch& pitch) {
    return os << to_string(pitch);
}

} // namespace doves

#endif // DOVES_NOTE_HPP
