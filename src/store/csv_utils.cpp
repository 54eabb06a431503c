#include "csv_utils.hpp"

namespace tillpoint::store {

std::vector<std::string> split_csv_line(std::string_view line) {
  std::vector<std::string> cols;
  std::string current;
  bool in_quotes = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      cols.push_back(std::move(current));
      current.clear();
    } else if (c != '\r') {
      current.push_back(c);
    }
  }
  cols.push_back(std::move(current));
  return cols;
}

bool read_csv_record(std::istream& in, std::string& record) {
  record.clear();
  std::string line;
  bool in_quotes = false;
  bool read_any = false;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (read_any) record.push_back('\n');
    record += line;
    read_any = true;
    for (const char c : line) {
      if (c == '"') in_quotes = !in_quotes;
    }
    if (!in_quotes) return true;
  }
  return read_any;
}

std::string csv_escape(std::string_view value) {
  const bool needs_quotes =
      value.find_first_of(",\"\n\r") != std::string_view::npos;
  if (!needs_quotes) return std::string(value);

  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char c : value) {
    if (c == '"') escaped.push_back('"');
    escaped.push_back(c);
  }
  escaped.push_back('"');
  return escaped;
}

}  // namespace tillpoint::store
