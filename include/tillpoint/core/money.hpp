#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tillpoint::core {

/// Amounts are integer minor units (cents) so that totals add up exactly.
using Cents = std::int64_t;

/// Sales tax applied at checkout, in basis points (1200 = 12%).
inline constexpr std::int32_t kDefaultTaxRateBp = 1200;

/// Parses a non-negative decimal such as "300", "12.5" or "0.99".
/// Rejects signs, exponents, more than two fraction digits and empty input.
[[nodiscard]] std::optional<Cents> parse_amount(std::string_view text);

/// Formats cents as "224.00".
[[nodiscard]] std::string format_amount(Cents amount);

/// amount * rate_bp / 10000, rounded half up (non-negative amounts).
[[nodiscard]] Cents apply_rate(Cents amount, std::int32_t rate_bp) noexcept;

}  // namespace tillpoint::core
