#include <tillpoint/core/text.hpp>
#include <algorithm>
#include <cctype>

namespace tillpoint::core {

std::string_view trim_view(std::string_view s) noexcept {
  const auto start = s.find_first_not_of(kWhitespace);
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(kWhitespace);
  return s.substr(start, end - start + 1);
}

std::string trim_copy(std::string_view s) {
  return std::string(trim_view(s));
}

std::string lower_copy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::optional<std::pair<std::string, std::string>> split_key_value(std::string_view line) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return std::nullopt;
  std::string key = trim_copy(line.substr(0, pos));
  if (key.empty()) return std::nullopt;
  return std::make_pair(std::move(key), trim_copy(line.substr(pos + 1)));
}

}  // namespace tillpoint::core
