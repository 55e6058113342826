/**
 * @file decoder.cpp
 * @brief Scalar and composite field decoders.
 */

#include <doves/decoder.hpp>

#include <charconv>
#include <cmath>
#include <locale>
#include <sstream>

namespace doves {

namespace {

bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim_spaces(std::string_view s) noexcept {
    while (!s.empty() && is_ascii_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ascii_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Length of the UTF-8 sequence introduced by a lead byte. Malformed
// leads count as one byte so that they surface as a bad character.
std::size_t utf8_length(unsigned char lead) noexcept {
    if (lead < 0x80U) {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U) {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U) {
        return 4;
    }
    return 1;
}

// Next character of s starting at pos, advancing pos past it.
std::string_view next_char(std::string_view s, std::size_t& pos) noexcept {
    std::size_t len = utf8_length(static_cast<unsigned char>(s[pos]));
    if (pos + len > s.size()) {
        len = s.size() - pos;
    }
    std::string_view c = s.substr(pos, len);
    pos += len;
    return c;
}

} // namespace

Error decode_unsigned(std::string_view raw, std::uint64_t& out) noexcept {
    if (raw.empty()) {
        return Error::InvalidNumber;
    }

    std::uint64_t value = 0;
    const char* end = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(raw.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return Error::InvalidNumber;
    }

    out = value;
    return Error::Ok;
}

Error decode_number(std::string_view raw, double& out) {
    if (raw.empty() || is_ascii_space(raw.front())) {
        return Error::InvalidNumber;
    }

    std::istringstream iss{std::string(raw)};
    iss.imbue(std::locale::classic());

    double value = 0.0;
    iss >> value;
    if (iss.fail()) {
        return Error::InvalidNumber;
    }
    if (iss.peek() != std::istringstream::traits_type::eof()) {
        return Error::InvalidNumber;
    }
    if (!std::isfinite(value)) {
        return Error::InvalidNumber;
    }

    out = value;
    return Error::Ok;
}

Error decode_weight(std::string_view raw, Weight& out, const DecodeOptions& options) {
    double lbs = 0.0;
    auto result = decode_number(raw, lbs);
    if (result != Error::Ok) {
        return result;
    }

    if (options.reject_negative_weight && lbs < 0.0) {
        return Error::InvalidRange;
    }

    out = Weight(lbs);
    return Error::Ok;
}

Error decode_pitch(std::string_view raw, std::optional<Pitch>& out,
                   const DecodeOptions& options) noexcept {
    if (raw.empty()) {
        // Empty strings are an absent pitch, not an error
        out.reset();
        return Error::Ok;
    }

    std::size_t pos = 0;
    std::string_view first = next_char(raw, pos);

    Pitch pitch;
    if (first.size() != 1 || first[0] < 'A' || first[0] > 'G') {
        return Error::InvalidNoteName;
    }
    pitch.name = static_cast<NoteName>(first[0] - 'A');

    if (pos == raw.size()) {
        pitch.accidental = Accidental::Natural;
    } else {
        std::string_view second = next_char(raw, pos);
        if (second == "b" || second == FLAT_GLYPH) {
            pitch.accidental = Accidental::Flat;
        } else if (second == NATURAL_GLYPH) {
            pitch.accidental = Accidental::Natural;
        } else if (second == "#" || second == SHARP_GLYPH) {
            pitch.accidental = Accidental::Sharp;
        } else {
            return Error::InvalidAccidental;
        }
    }

    if (options.strict_pitch && pos < raw.size()) {
        return Error::TrailingData;
    }

    out = pitch;
    return Error::Ok;
}

std::vector<std::string> decode_list(std::string_view raw) {
    std::vector<std::string> out;

    std::size_t start = 0;
    for (;;) {
        std::size_t end = raw.find(LIST_DELIMITER, start);
        if (end == std::string_view::npos) {
            out.emplace_back(raw.substr(start));
            break;
        }
        out.emplace_back(raw.substr(start, end - start));
        start = end + 1;
    }

    return out;
}

Error decode_affiliations(std::string_view raw, AffiliationSet& out,
                          std::string_view* unknown_code) noexcept {
    AffiliationSet set;

    std::size_t start = 0;
    while (start <= raw.size()) {
        std::size_t end = raw.find(AFFILIATION_DELIMITER, start);
        if (end == std::string_view::npos) {
            end = raw.size();
        }

        std::string_view code = trim_spaces(raw.substr(start, end - start));
        if (!code.empty()) {
            auto value = find_affiliation(code);
            if (!value) {
                if (unknown_code != nullptr) {
                    *unknown_code = code;
                }
                return Error::UnknownAffiliation;
            }
            set.insert(*value);
        }

        start = end + 1;
    }

    out = set;
    return Error::Ok;
}

} // namespace doves
