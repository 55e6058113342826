/**
 * @file csv_reader.hpp
 * @brief Reader for the comma-separated Dove's Guide export.
 *
 * Turns a header-named table into RawRecords, one per data row.
 * Supports RFC 4180 quoting (delimiters, doubled quotes and line breaks
 * inside quoted cells), CRLF line endings and a UTF-8 BOM before the
 * header. Blank lines are skipped. Cells are passed on verbatim; no
 * trimming or type conversion happens here.
 */

#ifndef DOVES_CSV_READER_HPP
#define DOVES_CSV_READER_HPP

#include "config.hpp"
#include "error.hpp"
#include "schema.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace doves {

/**
 * @brief Split CSV text into rows of cells.
 *
 * @param text Complete file contents
 * @param[out] rows Parsed rows (blank lines dropped)
 * @param[out] lines 1-based line number where each row starts
 * @param delimiter Cell separator
 * @return Error::Ok, or Error::Io for an unterminated quoted cell
 */
Error split_csv(std::string_view text, std::vector<std::vector<std::string>>& rows,
                std::vector<std::size_t>& lines, char delimiter = CSV_DELIMITER);

/**
 * @brief Read a header-named table from a stream.
 *
 * @param in Input stream
 * @param[out] records One RawRecord per data row
 * @param[out] message If non-null, receives a description of the failure
 * @return Error::Ok, or Error::Io for unreadable or malformed input
 */
Error read_csv(std::istream& in, std::vector<RawRecord>& records, std::string* message = nullptr);

/**
 * @brief Read a header-named table from a file.
 * @see read_csv()
 */
Error read_csv_file(const std::string& path, std::vector<RawRecord>& records,
                    std::string* message = nullptr);

} // namespace doves

#endif // DOVES_CSV_READER_HPP
