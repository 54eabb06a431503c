#pragma once

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace tillpoint::store {

/// Splits one CSV record; supports "quoted, fields" and "" escapes.
std::vector<std::string> split_csv_line(std::string_view line);

/// Reads one CSV record, joining physical lines while a quoted field is open.
/// Returns false at end of input.
bool read_csv_record(std::istream& in, std::string& record);

/// Quotes value if it contains a comma, quote or line break.
std::string csv_escape(std::string_view value);

}  // namespace tillpoint::store
