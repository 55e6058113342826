/**
 * @file test_edge_cases.cpp
 * @brief Edge case and concurrency tests for record decoding.
 */

#include <catch2/catch.hpp>
#include <doves/doves.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace doves;

namespace {

RawRecord base_record(std::size_t id) {
    return RawRecord{
        {"TowerID", std::to_string(id)},
        {"RingType", "Full circle ring"},
        {"Bells", "6"},
        {"UR", ""},
        {"GF", ""},
        {"Toilet", ""},
        {"Simulator", ""},
        {"App", ""},
        {"Wt", "700"},
        {"Place", "Anywhere"},
        {"Dedicn", "S Peter"},
        {"Affiliations", "CUG;ODG;Surr"},
        {"Note", "G"},
    };
}

} // namespace

// ============================================================================
// Presence flags
// ============================================================================

TEST_CASE("Presence flag over all single bytes", "[edge][presence]") {
    for (int c = 0; c < 256; ++c) {
        std::string raw(1, static_cast<char>(c));
        REQUIRE(decode_presence(raw));
    }
    REQUIRE_FALSE(decode_presence(std::string()));
}

TEST_CASE("Presence flag fields ignore their text", "[edge][presence]") {
    RawRecord raw = base_record(1);
    raw["UR"] = "anything at all";
    raw["App"] = "0";

    Ring ring;
    std::vector<DecodeError> errors;
    REQUIRE(assemble_ring(raw, ring, errors) == Error::Ok);
    REQUIRE(ring.unringable);
    REQUIRE(ring.app);
    REQUIRE_FALSE(ring.toilet);
}

// ============================================================================
// Pitch
// ============================================================================

TEST_CASE("Pitch edge cases", "[edge][pitch]") {
    std::optional<Pitch> pitch;

    SECTION("truncated UTF-8 accidental") {
        REQUIRE(decode_pitch("C\xE2\x99", pitch) == Error::InvalidAccidental);
    }

    SECTION("other musical glyph") {
        // U+266A EIGHTH NOTE
        REQUIRE(decode_pitch("C\xE2\x99\xAA", pitch) == Error::InvalidAccidental);
    }

    SECTION("glyph accidental followed by text") {
        REQUIRE(decode_pitch("A\xE2\x99\xAF extra", pitch) == Error::Ok);
        REQUIRE(pitch == Pitch{NoteName::A, Accidental::Sharp});
    }

    SECTION("failed decode leaves output untouched") {
        pitch = Pitch{NoteName::F, Accidental::Natural};
        REQUIRE(decode_pitch("X", pitch) == Error::InvalidNoteName);
        REQUIRE(pitch == Pitch{NoteName::F, Accidental::Natural});
    }
}

// ============================================================================
// Lists and sets
// ============================================================================

TEST_CASE("List of delimiters only", "[edge][list]") {
    auto list = decode_list(";;;");
    REQUIRE(list.size() == 4);
    for (const auto& item : list) {
        REQUIRE(item.empty());
    }
}

TEST_CASE("Affiliation set is order and duplicate insensitive", "[edge][affiliation]") {
    AffiliationSet a;
    AffiliationSet b;
    AffiliationSet c;
    REQUIRE(decode_affiliations("CUG;CUG;ODG", a) == Error::Ok);
    REQUIRE(decode_affiliations("ODG;CUG", b) == Error::Ok);
    REQUIRE(decode_affiliations("ODG;CUG;ODG;CUG", c) == Error::Ok);
    REQUIRE(a.size() == 2);
    REQUIRE(a == b);
    REQUIRE(b == c);
}

TEST_CASE("Every vocabulary code at once", "[edge][affiliation]") {
    std::string raw;
    for (const auto& entry : AFFILIATIONS) {
        if (!raw.empty()) {
            raw += ';';
        }
        raw += entry.code;
    }

    AffiliationSet set;
    REQUIRE(decode_affiliations(raw, set) == Error::Ok);
    REQUIRE(set.size() == AFFILIATION_COUNT);
}

// ============================================================================
// Numbers
// ============================================================================

TEST_CASE("Large and fractional weights", "[edge][weight]") {
    Weight w;
    REQUIRE(decode_weight("0", w) == Error::Ok);
    REQUIRE(w.pounds() == 0.0);
    REQUIRE(decode_weight("92160.25", w) == Error::Ok);
    REQUIRE(w.pounds() == 92160.25);
    REQUIRE(decode_weight("1e400", w) == Error::InvalidNumber);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("Concurrent decoding needs no coordination", "[edge][concurrency]") {
    constexpr std::size_t THREADS = 8;
    constexpr std::size_t PER_THREAD = 200;

    std::vector<RawRecord> records;
    for (std::size_t i = 0; i < PER_THREAD; ++i) {
        records.push_back(base_record(i + 1));
    }

    std::vector<Doves> results(THREADS);
    std::vector<Error> status(THREADS, Error::Io);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t]() { status[t] = results[t].load(records, ErrorPolicy::Abort); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (std::size_t t = 0; t < THREADS; ++t) {
        REQUIRE(status[t] == Error::Ok);
        REQUIRE(results[t].size() == PER_THREAD);
        for (std::size_t i = 0; i < PER_THREAD; ++i) {
            REQUIRE(results[t][i] == results[0][i]);
        }
    }
}
