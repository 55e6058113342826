/**
 * @file note.cpp
 * @brief Pitch rendering.
 */

#include <doves/note.hpp>

namespace doves {

std::string to_string(NoteName name) {
    switch (name) {
    case NoteName::A:
        return "A";
    case NoteName::B:
        return "B";
    case NoteName::C:
        return "C";
    case NoteName::D:
        return "D";
    case NoteName::E:
        return "E";
    case NoteName::F:
        return "F";
    case NoteName::G:
        return "G";
    }
    return "?";
}

std::string to_string(Accidental accidental) {
    switch (accidental) {
    case Accidental::Flat:
        return FLAT_GLYPH;
    case Accidental::Natural:
        return {};
    case Accidental::Sharp:
        return SHARP_GLYPH;
    }
    return {};
}

std::string to_string(const Pitch& pitch) {
    return to_string(pitch.name) + to_string(pitch.accidental);
}

} // namespace doves
