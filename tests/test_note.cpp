/**
 * @file test_note.cpp
 * @brief Unit tests for Pitch rendering.
 */

#include <doves/note.hpp>

#include <catch2/catch.hpp>

#include <sstream>

using namespace doves;

TEST_CASE("Note name rendering", "[note]") {
    REQUIRE(to_string(NoteName::A) == "A");
    REQUIRE(to_string(NoteName::D) == "D");
    REQUIRE(to_string(NoteName::G) == "G");
}

TEST_CASE("Accidental rendering", "[note]") {
    SECTION("natural has no symbol") {
        REQUIRE(to_string(Accidental::Natural).empty());
    }

    SECTION("flat and sharp use the glyphs") {
        REQUIRE(to_string(Accidental::Flat) == "\xE2\x99\xAD");
        REQUIRE(to_string(Accidental::Sharp) == "\xE2\x99\xAF");
    }
}

TEST_CASE("Pitch rendering", "[note]") {
    REQUIRE(to_string(Pitch{NoteName::C, Accidental::Natural}) == "C");
    REQUIRE(to_string(Pitch{NoteName::E, Accidental::Flat}) == "E\xE2\x99\xAD");
    REQUIRE(to_string(Pitch{NoteName::F, Accidental::Sharp}) == "F\xE2\x99\xAF");

    std::ostringstream os;
    os << Pitch{NoteName::B, Accidental::Flat};
    REQUIRE(os.str() == "B\xE2\x99\xAD");
}

TEST_CASE("Pitch equality", "[note]") {
    REQUIRE(Pitch{NoteName::C, Accidental::Sharp} == Pitch{NoteName::C, Accidental::Sharp});
    REQUIRE_FALSE(Pitch{NoteName::C, Accidental::Sharp} == Pitch{NoteName::D, Accidental::Flat});
}
