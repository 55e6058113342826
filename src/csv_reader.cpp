/**
 * @file csv_reader.cpp
 * @brief CSV export reader.
 */

#include <doves/csv_reader.hpp>

#include <fstream>
#include <iterator>
#include <set>
#include <utility>

namespace doves {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

void set_message(std::string* message, const std::string& text) {
    if (message != nullptr) {
        *message = text;
    }
}

bool is_blank(const std::vector<std::string>& row) noexcept {
    return row.size() == 1 && row.front().empty();
}

} // namespace

Error split_csv(std::string_view text, std::vector<std::vector<std::string>>& rows,
                std::vector<std::size_t>& lines, char delimiter) {
    rows.clear();
    lines.clear();

    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    std::size_t line = 1;
    std::size_t row_line = 1;

    auto end_row = [&]() {
        row.push_back(std::move(cell));
        cell.clear();
        if (!is_blank(row)) {
            rows.push_back(std::move(row));
            lines.push_back(row_line);
        }
        row.clear();
    };

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                // Doubled quote is a literal quote
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') {
                    ++line;
                }
                cell.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            row.push_back(std::move(cell));
            cell.clear();
        } else if (c == '\r' && (i + 1 == text.size() || text[i + 1] == '\n')) {
            // CRLF: the '\n' ends the row; a final bare CR ends the text
        } else if (c == '\n') {
            end_row();
            ++line;
            row_line = line;
        } else {
            cell.push_back(c);
        }
    }

    if (in_quotes) {
        return Error::Io;
    }

    // Final row without a trailing newline
    if (!cell.empty() || !row.empty()) {
        end_row();
    }

    return Error::Ok;
}

Error read_csv(std::istream& in, std::vector<RawRecord>& records, std::string* message) {
    records.clear();

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        set_message(message, "read failure");
        return Error::Io;
    }

    std::string_view view = text;
    if (view.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
        view.remove_prefix(UTF8_BOM.size());
    }

    std::vector<std::vector<std::string>> rows;
    std::vector<std::size_t> lines;
    if (split_csv(view, rows, lines) != Error::Ok) {
        set_message(message, "unterminated quoted cell");
        return Error::Io;
    }

    if (rows.empty()) {
        set_message(message, "missing header row");
        return Error::Io;
    }

    const std::vector<std::string>& header = rows.front();
    std::set<std::string> seen;
    for (const auto& name : header) {
        if (!seen.insert(name).second) {
            set_message(message, "duplicate column '" + name + "'");
            return Error::Io;
        }
    }

    records.reserve(rows.size() - 1);
    for (std::size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() != header.size()) {
            set_message(message, "line " + std::to_string(lines[r]) + ": expected " +
                                     std::to_string(header.size()) + " fields, found " +
                                     std::to_string(row.size()));
            records.clear();
            return Error::Io;
        }

        RawRecord record;
        for (std::size_t c = 0; c < header.size(); ++c) {
            record.emplace(header[c], row[c]);
        }
        records.push_back(std::move(record));
    }

    return Error::Ok;
}

Error read_csv_file(const std::string& path, std::vector<RawRecord>& records,
                    std::string* message) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        set_message(message, "cannot open " + path);
        return Error::Io;
    }
    return read_csv(file, records, message);
}

} // namespace doves
