/**
 * @file schema.hpp
 * @brief Closed record schema and record assembler.
 *
 * The schema is a static table naming every recognised export header,
 * whether it is mandatory, and the decoder that stores it into a Ring.
 * assemble_ring() validates a whole raw record against it and collects
 * every field error in a single pass.
 */

#ifndef DOVES_SCHEMA_HPP
#define DOVES_SCHEMA_HPP

#include "config.hpp"
#include "error.hpp"
#include "ring.hpp"

#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace doves {

/// Raw cell value; std::nullopt is a null cell
using RawValue = std::optional<std::string>;

/// One raw record: header name -> raw value
using RawRecord = std::map<std::string, RawValue, std::less<>>;

/**
 * @brief Stores one decoded field into a Ring.
 *
 * @param raw Raw field text
 * @param ring Record under construction
 * @param options Decode policy
 * @param[out] offending Text to report on failure; preset to `raw`
 * @return Error::Ok or the field's decode error
 */
using FieldDecoder = Error (*)(std::string_view raw, Ring& ring, const DecodeOptions& options,
                               std::string_view& offending);

/**
 * @brief One schema entry.
 */
struct FieldSpec {
    std::string_view name;
    bool required;
    FieldDecoder decode;
};

/**
 * @brief The record schema, mandatory fields first.
 */
std::span<const FieldSpec> record_schema() noexcept;

/**
 * @brief Look up a header in the schema.
 * @return The entry, or nullptr for unknown headers
 */
const FieldSpec* find_field(std::string_view name) noexcept;

/**
 * @brief Assemble a Ring from a raw record.
 *
 * - headers outside the schema: Error::UnknownField
 * - mandatory headers absent or null: Error::MissingField
 * - every present field goes through its decoder; failures are collected
 *
 * `out` is only written when no error was collected.
 *
 * @param raw Raw record
 * @param[out] out Assembled ring
 * @param[out] errors Every collected error (cleared first)
 * @param options Decode policy
 * @return Error::Ok, or the kind of the first collected error
 */
Error assemble_ring(const RawRecord& raw, Ring& out, std::vector<DecodeError>& errors,
                    const DecodeOptions& options = {});

#if !DOVES_NO_EXCEPTIONS

/**
 * @brief Assemble a Ring or throw.
 * @throws RecordException carrying every collected error
 */
Ring decode_ring(const RawRecord& raw, const DecodeOptions& options = {});

#endif // !DOVES_NO_EXCEPTIONS

} // namespace doves

#endif // DOVES_SCHEMA_HPP
