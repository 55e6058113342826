/**
 * @file bench.cpp
 * @brief Record assembly benchmarks.
 *
 * Measures decode throughput on synthetic records for regression
 * testing during development. Use for relative comparisons only.
 *
 * Usage:
 *   ./build/doves_bench           # Run with default 100 iterations
 *   ./build/doves_bench 1000      # Run with custom iteration count
 */

#include <doves/doves.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace doves;

static constexpr int DEFAULT_ITERATIONS = 100;
static constexpr std::size_t RECORDS_PER_ITERATION = 1000;

static RawRecord minimal_record(std::size_t id) {
    return RawRecord{
        {"TowerID", std::to_string(id)},
        {"RingType", "Full circle ring"},
        {"Bells", "8"},
        {"UR", ""},
        {"GF", "GF"},
        {"Toilet", ""},
        {"Simulator", "S"},
        {"App", ""},
        {"Wt", "1456"},
        {"Place", "Somewhere"},
        {"Dedicn", "S Mary"},
    };
}

static RawRecord full_record(std::size_t id) {
    RawRecord record = minimal_record(id);
    record["Affiliations"] = "ODG;CUG";
    record["ExtraInfo"] = "Ground floor ring;Ringing chamber reached by ladder";
    record["Note"] = "E\xE2\x99\xAD";
    record["Hz"] = "622.3";
    record["Details"] = "P";
    record["TowerBase"] = "1234";
    record["Practice"] = "Wed 19:30";
    record["Long"] = "-1.2577";
    record["Lat"] = "51.7520";
    record["OvhaulYr"] = "1987";
    record["TuneYr"] = "1987";
    record["Country"] = "England";
    record["County"] = "Oxfordshire";
    return record;
}

static void bench_assemble(const char* name, RawRecord (*make)(std::size_t), int iterations) {
    std::vector<RawRecord> records;
    records.reserve(RECORDS_PER_ITERATION);
    for (std::size_t i = 0; i < RECORDS_PER_ITERATION; ++i) {
        records.push_back(make(i + 1));
    }

    // Warmup run
    Doves doves;
    if (doves.load(records, ErrorPolicy::Abort) != Error::Ok) {
        const auto& first = doves.rejected().front().errors.front();
        std::printf("%-20s FAIL (%s)\n", name, describe(first).c_str());
        return;
    }

    // Benchmark
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        doves.load(records, ErrorPolicy::Abort);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_us = std::chrono::duration<double, std::micro>(end - start).count();
    double per_iter_us = total_us / static_cast<double>(iterations);
    double per_record_us = per_iter_us / static_cast<double>(RECORDS_PER_ITERATION);
    double records_per_s = 1.0e6 / per_record_us;

    std::printf("%-20s %10.2f µs/iter  %6.3f µs/rec  %10.0f rec/s\n",
                name, per_iter_us, per_record_us, records_per_s);
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("Dove's Guide Decoder Benchmarks\n");
    std::printf("===============================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Records per iteration: %zu\n\n", RECORDS_PER_ITERATION);

    std::printf("%-20s %16s  %13s  %14s\n", "Test", "Time", "Per-Record", "Throughput");
    std::printf("%-20s %16s  %13s  %14s\n", "----", "----", "----------", "----------");

    bench_assemble("minimal", minimal_record, iterations);
    bench_assemble("full", full_record, iterations);

    return 0;
}
