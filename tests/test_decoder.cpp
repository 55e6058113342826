/**
 * @file test_decoder.cpp
 * @brief Unit tests for the scalar and composite field decoders.
 */

#include <doves/decoder.hpp>

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace doves;

TEST_CASE("Presence flag", "[decoder][presence]") {
    SECTION("empty is false") {
        REQUIRE_FALSE(decode_presence(""));
    }

    SECTION("any content is true") {
        REQUIRE(decode_presence("u/r"));
        REQUIRE(decode_presence("GF"));
        REQUIRE(decode_presence("T"));
        REQUIRE(decode_presence(" "));
        REQUIRE(decode_presence("0"));
        REQUIRE(decode_presence("false"));
    }
}

TEST_CASE("Weight decode", "[decoder][weight]") {
    Weight weight;

    SECTION("decimal pounds") {
        REQUIRE(decode_weight("12.5", weight) == Error::Ok);
        REQUIRE(weight.pounds() == 12.5);
    }

    SECTION("integer pounds") {
        REQUIRE(decode_weight("2667", weight) == Error::Ok);
        REQUIRE(weight.pounds() == 2667.0);
    }

    SECTION("not a number") {
        weight = Weight(7.0);
        REQUIRE(decode_weight("abc", weight) == Error::InvalidNumber);
        REQUIRE(weight.pounds() == 7.0);
    }

    SECTION("empty is not a number") {
        REQUIRE(decode_weight("", weight) == Error::InvalidNumber);
    }

    SECTION("trailing text") {
        REQUIRE(decode_weight("12.5lb", weight) == Error::InvalidNumber);
        REQUIRE(decode_weight("12.5 ", weight) == Error::InvalidNumber);
        REQUIRE(decode_weight(" 12.5", weight) == Error::InvalidNumber);
    }

    SECTION("negative accepted by default") {
        REQUIRE(decode_weight("-3", weight) == Error::Ok);
        REQUIRE(weight.pounds() == -3.0);
    }

    SECTION("negative rejected when strict") {
        DecodeOptions options;
        options.reject_negative_weight = true;
        REQUIRE(decode_weight("-3", weight, options) == Error::InvalidRange);
        REQUIRE(decode_weight("0", weight, options) == Error::Ok);
    }
}

TEST_CASE("Pitch decode", "[decoder][pitch]") {
    std::optional<Pitch> pitch;

    SECTION("empty is absent") {
        pitch = Pitch{NoteName::A, Accidental::Sharp};
        REQUIRE(decode_pitch("", pitch) == Error::Ok);
        REQUIRE_FALSE(pitch.has_value());
    }

    SECTION("bare note name is natural") {
        REQUIRE(decode_pitch("C", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::C, Accidental::Natural});
    }

    SECTION("every note name") {
        const char* names[] = {"A", "B", "C", "D", "E", "F", "G"};
        for (int i = 0; i < 7; ++i) {
            REQUIRE(decode_pitch(names[i], pitch) == Error::Ok);
            REQUIRE(pitch->name == static_cast<NoteName>(i));
        }
    }

    SECTION("sharp") {
        REQUIRE(decode_pitch("C#", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::C, Accidental::Sharp});

        REQUIRE(decode_pitch("F\xE2\x99\xAF", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::F, Accidental::Sharp});
    }

    SECTION("flat") {
        REQUIRE(decode_pitch("C\xE2\x99\xAD", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::C, Accidental::Flat});

        REQUIRE(decode_pitch("Eb", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::E, Accidental::Flat});
    }

    SECTION("explicit natural") {
        REQUIRE(decode_pitch("D\xE2\x99\xAE", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::D, Accidental::Natural});
    }

    SECTION("invalid note name") {
        REQUIRE(decode_pitch("H", pitch) == Error::InvalidNoteName);
        REQUIRE(decode_pitch("c", pitch) == Error::InvalidNoteName);
        REQUIRE(decode_pitch("#", pitch) == Error::InvalidNoteName);
        REQUIRE(decode_pitch("\xE2\x99\xAD", pitch) == Error::InvalidNoteName);
    }

    SECTION("invalid accidental") {
        REQUIRE(decode_pitch("C$", pitch) == Error::InvalidAccidental);
        REQUIRE(decode_pitch("CB", pitch) == Error::InvalidAccidental);
        REQUIRE(decode_pitch("C ", pitch) == Error::InvalidAccidental);
    }

    SECTION("trailing characters ignored by default") {
        REQUIRE(decode_pitch("C#xyz", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::C, Accidental::Sharp});
    }

    SECTION("trailing characters rejected when strict") {
        DecodeOptions options;
        options.strict_pitch = true;
        REQUIRE(decode_pitch("C#x", pitch, options) == Error::TrailingData);
        REQUIRE(decode_pitch("B\xE2\x99\xAD", pitch, options) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::B, Accidental::Flat});
    }
}

TEST_CASE("Free-text list decode", "[decoder][list]") {
    using List = std::vector<std::string>;

    SECTION("empty input is one empty element") {
        REQUIRE(decode_list("") == List{""});
    }

    SECTION("plain split") {
        REQUIRE(decode_list("a;b;c") == List{"a", "b", "c"});
    }

    SECTION("empty segments kept") {
        REQUIRE(decode_list("a;;b") == List{"a", "", "b"});
        REQUIRE(decode_list(";a;") == List{"", "a", ""});
        REQUIRE(decode_list(";") == List{"", ""});
    }

    SECTION("whitespace is not trimmed") {
        REQUIRE(decode_list(" a ; b") == List{" a ", " b"});
    }

    SECTION("duplicates kept in order") {
        REQUIRE(decode_list("x;y;x") == List{"x", "y", "x"});
    }
}

TEST_CASE("Affiliation set decode", "[decoder][affiliation]") {
    AffiliationSet set;

    SECTION("empty input is empty set") {
        REQUIRE(decode_affiliations("", set) == Error::Ok);
        REQUIRE(set.empty());
    }

    SECTION("single code") {
        REQUIRE(decode_affiliations("ODG", set) == Error::Ok);
        REQUIRE(set.size() == 1);
        REQUIRE(set.contains(Affiliation::OxfordDiocese));
    }

    SECTION("duplicates collapse and order is irrelevant") {
        AffiliationSet other;
        REQUIRE(decode_affiliations("CUG;CUG;ODG", set) == Error::Ok);
        REQUIRE(decode_affiliations("ODG;CUG", other) == Error::Ok);
        REQUIRE(set.size() == 2);
        REQUIRE(set == other);
    }

    SECTION("codes with punctuation") {
        REQUIRE(decode_affiliations("W&P;Bev&D", set) == Error::Ok);
        REQUIRE(set.contains(Affiliation::WinchesterPortsmouth));
        REQUIRE(set.contains(Affiliation::BeverleyDistrict));
    }

    SECTION("spaces and empty segments ignored") {
        REQUIRE(decode_affiliations(" Surr ; ;KCA;", set) == Error::Ok);
        REQUIRE(set.size() == 2);
        REQUIRE(set.contains(Affiliation::Surrey));
        REQUIRE(set.contains(Affiliation::Kent));
    }

    SECTION("unknown code") {
        std::string_view bad;
        set.insert(Affiliation::Essex);
        REQUIRE(decode_affiliations("ODG;XYZ;CUG", set, &bad) == Error::UnknownAffiliation);
        REQUIRE(bad == "XYZ");
        // Output untouched on failure
        REQUIRE(set.size() == 1);
        REQUIRE(set.contains(Affiliation::Essex));
    }

    SECTION("codes are case-sensitive") {
        REQUIRE(decode_affiliations("odg", set) == Error::UnknownAffiliation);
    }
}

TEST_CASE("Unsigned decode", "[decoder][number]") {
    std::uint64_t value = 0;

    REQUIRE(decode_unsigned("0", value) == Error::Ok);
    REQUIRE(value == 0);
    REQUIRE(decode_unsigned("16542", value) == Error::Ok);
    REQUIRE(value == 16542);

    REQUIRE(decode_unsigned("", value) == Error::InvalidNumber);
    REQUIRE(decode_unsigned("-1", value) == Error::InvalidNumber);
    REQUIRE(decode_unsigned("+1", value) == Error::InvalidNumber);
    REQUIRE(decode_unsigned("1.5", value) == Error::InvalidNumber);
    REQUIRE(decode_unsigned(" 1", value) == Error::InvalidNumber);
    REQUIRE(decode_unsigned("99999999999999999999999", value) == Error::InvalidNumber);
}

TEST_CASE("Number decode", "[decoder][number]") {
    double value = 0.0;

    REQUIRE(decode_number("51.7520", value) == Error::Ok);
    REQUIRE(value == 51.752);
    REQUIRE(decode_number("-1.25", value) == Error::Ok);
    REQUIRE(value == -1.25);
    REQUIRE(decode_number("1e3", value) == Error::Ok);
    REQUIRE(value == 1000.0);

    REQUIRE(decode_number("", value) == Error::InvalidNumber);
    REQUIRE(decode_number("1,5", value) == Error::InvalidNumber);
    REQUIRE(decode_number("nan", value) == Error::InvalidNumber);
    REQUIRE(decode_number("inf", value) == Error::InvalidNumber);
}
