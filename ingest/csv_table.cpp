#include "csv_table.hpp"
#include "zf_log.h"

#include <fstream>
#include <iterator>
#include <sstream>

namespace fdr {

static std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return std::string();
    size_t last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

static bool is_blank_row(const std::vector<std::string>& row) {
    return row.size() == 1 && row[0].empty();
}

Result<RawTable, SchemaError> parse_csv(std::string_view text) {
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        text.remove_prefix(3);
    }

    std::vector<std::vector<std::string>> records;
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool cell_was_quoted = false;

    auto end_cell = [&]() {
        row.push_back(std::move(cell));
        cell.clear();
        cell_was_quoted = false;
    };
    auto end_row = [&]() {
        bool quoted = cell_was_quoted;
        end_cell();
        // a lone empty unquoted cell is a blank line, not a row
        if (!is_blank_row(row) || quoted) {
            records.push_back(std::move(row));
        }
        row.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell.push_back(c);
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                cell_was_quoted = true;
                break;
            case ',':
                end_cell();
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                cell.push_back(c);
                break;
        }
    }
    if (!cell.empty() || !row.empty() || cell_was_quoted) {
        end_row();
    }

    if (records.empty()) {
        return SchemaError{Error::TERM_EmptyHeader, ""};
    }

    RawTable table;
    table.header.reserve(records.front().size());
    for (const auto& name : records.front()) {
        table.header.push_back(trim(name));
    }
    table.rows.assign(std::make_move_iterator(records.begin() + 1),
                      std::make_move_iterator(records.end()));
    return table;
}

Result<RawTable, SchemaError> read_csv_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ZF_LOGE("Failed to open telemetry file: %s", path.c_str());
        return SchemaError{Error::TERM_IOError, path};
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        ZF_LOGE("Failed while reading telemetry file: %s", path.c_str());
        return SchemaError{Error::TERM_IOError, path};
    }

    return parse_csv(contents.str());
}

static void write_cell(std::string& out, const std::string& cell) {
    bool needs_quotes = cell.find_first_of(",\"\r\n") != std::string::npos;
    if (!needs_quotes) {
        out += cell;
        return;
    }
    out.push_back('"');
    for (char c : cell) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
}

static void write_row(std::string& out, const std::vector<std::string>& row) {
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out.push_back(',');
        write_cell(out, row[i]);
    }
    out.push_back('\n');
}

std::string write_csv(const RawTable& table) {
    std::string out;
    write_row(out, table.header);
    for (const auto& row : table.rows) {
        write_row(out, row);
    }
    return out;
}

} // namespace fdr
