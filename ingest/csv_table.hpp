#pragma once

#include "fdr.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace fdr {

// Untyped tabular input: one header row and any number of data rows.
// Rows may be ragged; the validator decides what a short or long row means.
struct RawTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

// RFC 4180 style parsing: quoted cells may hold commas, newlines and "" escapes.
// CRLF and LF endings are accepted, a UTF-8 BOM is stripped, blank lines are skipped.
Result<RawTable, SchemaError> parse_csv(std::string_view text);

Result<RawTable, SchemaError> read_csv_file(const std::string& path);

std::string write_csv(const RawTable& table);

} // namespace fdr
