/**
 * @file cli.cpp
 * @brief Dove's Guide export checker.
 *
 * Decodes every row of an export and reports how many rings were
 * decoded and which rows were rejected, with every field error.
 */

#include <doves/doves.hpp>

#include <cstdio>
#include <cstring>
#include <string>

using namespace doves;

static void print_version() {
    std::printf("doves %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nDove's Guide export decoder (v%s)\n", version());
    std::printf("==================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [options] <export.csv>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  --strict       Reject negative weights and over-long pitches\n");
    std::printf("  --abort        Stop at the first rejected row\n");
    std::printf("  --skip         Drop rejected rows without listing them\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Exit status is 0 when every row decodes, 1 otherwise.\n\n");
}

static void print_rejected(const Doves& doves) {
    for (const auto& row : doves.rejected()) {
        // +2: 1-based, after the header line
        std::fprintf(stderr, "Error: row %zu rejected\n", row.row + 2);
        for (const auto& error : row.errors) {
            std::fprintf(stderr, "  %s\n", describe(error).c_str());
        }
    }
}

static int do_check(const char* input_path, ErrorPolicy policy, const DecodeOptions& options) {
    Doves doves;
    std::string message;
    auto result = doves.load_file(input_path, policy, options, &message);

    if (result == Error::Io) {
        std::fprintf(stderr, "Error: Cannot read %s: %s\n", input_path, message.c_str());
        return 1;
    }

    print_rejected(doves);

    std::size_t affiliated = 0;
    std::size_t unringable = 0;
    for (const auto& ring : doves) {
        if (!ring.affiliations.empty()) {
            ++affiliated;
        }
        if (ring.unringable) {
            ++unringable;
        }
    }

    std::printf("Input:       %s\n", input_path);
    std::printf("Decoded:     %zu rings\n", doves.size());
    std::printf("Rejected:    %zu rows\n", doves.rejected().size());
    std::printf("Affiliated:  %zu\n", affiliated);
    std::printf("Unringable:  %zu\n", unringable);

    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Aborted: %s\n", error_string(result));
        return 1;
    }
    return doves.rejected().empty() ? 0 : 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    DecodeOptions options;
    ErrorPolicy policy = ErrorPolicy::Collect;
    const char* input_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "--strict") == 0) {
            options.reject_negative_weight = true;
            options.strict_pitch = true;
        } else if (std::strcmp(arg, "--abort") == 0) {
            policy = ErrorPolicy::Abort;
        } else if (std::strcmp(arg, "--skip") == 0) {
            policy = ErrorPolicy::Skip;
        } else if (arg[0] == '-') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            return 1;
        } else if (input_path == nullptr) {
            input_path = arg;
        } else {
            std::fprintf(stderr, "Error: Only one input file is accepted\n");
            return 1;
        }
    }

    if (input_path == nullptr) {
        std::fprintf(stderr, "Error: Missing input file\n");
        std::fprintf(stderr, "Usage: %s [options] <export.csv>\n", argv[0]);
        return 1;
    }

    return do_check(input_path, policy, options);
}
