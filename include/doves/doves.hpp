/**
 * @file doves.hpp
 * @brief High-level Dove's Guide API.
 *
 * Provides the Doves collection, which decodes a sequence of raw records
 * into Rings under a chosen error policy, and pulls in the whole public
 * interface.
 */

#ifndef DOVES_HPP
#define DOVES_HPP

#include "affiliation.hpp"
#include "config.hpp"
#include "csv_reader.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "note.hpp"
#include "ring.hpp"
#include "schema.hpp"
#include "weight.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace doves {

/**
 * @brief What Doves::load() does with a row that fails to decode.
 */
enum class ErrorPolicy {
    Abort,  ///< Stop at the first bad row
    Skip,   ///< Drop bad rows
    Collect ///< Drop bad rows and record their errors
};

/**
 * @brief Errors of one rejected row.
 */
struct RowError {
    std::size_t row; ///< 0-based index into the loaded raw records
    std::vector<DecodeError> errors;
};

/**
 * @brief Ordered, read-only collection of decoded rings.
 */
class Doves {
public:
    using const_iterator = std::vector<Ring>::const_iterator;

    Doves() = default;

    /**
     * @brief Decode raw records in order.
     *
     * Under ErrorPolicy::Abort the collection keeps the rings decoded
     * before the bad row, and rejected() holds that row's errors.
     *
     * @param records Raw records
     * @param policy Handling of bad rows
     * @param options Decode policy
     * @return Error::Ok, or the first error kind of the aborting row
     */
    Error load(const std::vector<RawRecord>& records, ErrorPolicy policy = ErrorPolicy::Collect,
               const DecodeOptions& options = {});

    /**
     * @brief Read and decode an export file.
     *
     * @param path CSV export
     * @param policy Handling of bad rows
     * @param options Decode policy
     * @param[out] message If non-null, receives the reader's failure description
     * @return Error::Ok, Error::Io, or the first error kind of an aborting row
     */
    Error load_file(const std::string& path, ErrorPolicy policy = ErrorPolicy::Collect,
                    const DecodeOptions& options = {}, std::string* message = nullptr);

    [[nodiscard]] std::size_t size() const noexcept {
        return rings_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return rings_.empty();
    }

    const Ring& operator[](std::size_t index) const noexcept {
        return rings_[index];
    }

    const_iterator begin() const noexcept {
        return rings_.begin();
    }

    const_iterator end() const noexcept {
        return rings_.end();
    }

    /**
     * @brief Rows rejected by the last load (empty under ErrorPolicy::Skip).
     */
    [[nodiscard]] const std::vector<RowError>& rejected() const noexcept {
        return rejected_;
    }

private:
    std::vector<Ring> rings_;
    std::vector<RowError> rejected_;
};

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace doves

#endif // DOVES_HPP
