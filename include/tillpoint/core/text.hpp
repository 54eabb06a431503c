#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tillpoint::core {

/// Whitespace stripped from both ends of scanned tokens, references and config lines.
inline constexpr std::string_view kWhitespace = " \t\n\v\f\r";

/// View of s without leading and trailing whitespace.
[[nodiscard]] std::string_view trim_view(std::string_view s) noexcept;

[[nodiscard]] std::string trim_copy(std::string_view s);

[[nodiscard]] std::string lower_copy(std::string_view s);

/// Splits "key = value" at the first '='. Both halves are trimmed.
/// Returns nullopt when there is no '=' or the key is empty.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> split_key_value(
    std::string_view line);

}  // namespace tillpoint::core
