/**
 * @file doves.cpp
 * @brief Ring collection loading.
 */

#include <doves/doves.hpp>

#include <utility>

namespace doves {

Error Doves::load(const std::vector<RawRecord>& records, ErrorPolicy policy,
                  const DecodeOptions& options) {
    rings_.clear();
    rejected_.clear();
    rings_.reserve(records.size());

    std::vector<DecodeError> errors;
    for (std::size_t i = 0; i < records.size(); ++i) {
        Ring ring;
        auto result = assemble_ring(records[i], ring, errors, options);
        if (result == Error::Ok) {
            rings_.push_back(std::move(ring));
            continue;
        }

        switch (policy) {
        case ErrorPolicy::Abort:
            rejected_.push_back({i, std::move(errors)});
            return result;
        case ErrorPolicy::Skip:
            break;
        case ErrorPolicy::Collect:
            rejected_.push_back({i, std::move(errors)});
            errors = {};
            break;
        }
    }

    return Error::Ok;
}

Error Doves::load_file(const std::string& path, ErrorPolicy policy, const DecodeOptions& options,
                       std::string* message) {
    std::vector<RawRecord> records;
    auto result = read_csv_file(path, records, message);
    if (result != Error::Ok) {
        rings_.clear();
        rejected_.clear();
        return result;
    }
    return load(records, policy, options);
}

} // namespace doves
