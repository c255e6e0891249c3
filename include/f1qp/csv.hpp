#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace f1qp {

// Small CSV helpers shared by the loaders. No quoted fields.
std::string trim(std::string s);
std::string lower(std::string s);
std::vector<std::string> split_csv_line(const std::string& line, char sep = ',');

// Whole-field parses; trailing garbage and non-finite values fail.
std::optional<double> parse_double(const std::string& s);
std::optional<int> parse_int(const std::string& s);
std::optional<bool> parse_bool(const std::string& s);

// Non-blank, non-'#' lines, each split into trimmed columns.
std::vector<std::vector<std::string>> read_csv_rows(std::istream& in);

// True when row[0] matches the expected first header column (case-insensitive).
bool is_header_row(const std::vector<std::string>& row, const std::string& first_col);

} // namespace f1qp
