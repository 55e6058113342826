/**
 * @file config.hpp
 * @brief Dove's Guide decoder compile-time configuration.
 *
 * Version constants, exception switch and the delimiters used by the
 * multi-valued encodings of the export.
 */

#ifndef DOVES_CONFIG_HPP
#define DOVES_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace doves {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Separator of the free-text list fields (e.g. ExtraInfo)
#ifndef DOVES_LIST_DELIMITER
#define DOVES_LIST_DELIMITER ';'
#endif

/// Separator of the affiliation codes in the Affiliations field
#ifndef DOVES_AFFILIATION_DELIMITER
#define DOVES_AFFILIATION_DELIMITER ';'
#endif

/// Column separator of the tabular export
#ifndef DOVES_CSV_DELIMITER
#define DOVES_CSV_DELIMITER ','
#endif

inline constexpr char LIST_DELIMITER = DOVES_LIST_DELIMITER;
inline constexpr char AFFILIATION_DELIMITER = DOVES_AFFILIATION_DELIMITER;
inline constexpr char CSV_DELIMITER = DOVES_CSV_DELIMITER;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define DOVES_NO_EXCEPTIONS=1 to drop the throwing convenience layer.
 * Decoders report through Error codes either way.
 * @{
 */
#ifndef DOVES_NO_EXCEPTIONS
#define DOVES_NO_EXCEPTIONS 0
#endif
/** @} */

/**
 * @brief Runtime decode policy.
 *
 * Both switches default to the permissive behaviour of the published
 * export. Turning one on adds a check, it never relaxes one.
 */
struct DecodeOptions {
    /// Fail negative weights with Error::InvalidRange
    bool reject_negative_weight = false;
    /// Fail pitch strings longer than name + accidental with Error::TrailingData
    bool strict_pitch = false;
};

} // namespace doves

#endif // DOVES_CONFIG_HPP
