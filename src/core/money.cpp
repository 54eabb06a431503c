#include <tillpoint/core/money.hpp>
#include <tillpoint/core/text.hpp>
#include <cctype>
#include <limits>

namespace tillpoint::core {

std::optional<Cents> parse_amount(std::string_view text) {
  text = trim_view(text);
  if (text.empty()) return std::nullopt;

  constexpr Cents kMax = std::numeric_limits<Cents>::max() / 100;
  Cents whole = 0;
  Cents fraction = 0;
  int fraction_digits = 0;
  bool seen_dot = false;
  bool seen_digit = false;

  for (const char c : text) {
    if (c == '.') {
      if (seen_dot) return std::nullopt;
      seen_dot = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    seen_digit = true;
    const int digit = c - '0';
    if (seen_dot) {
      if (++fraction_digits > 2) return std::nullopt;
      fraction = fraction * 10 + digit;
    } else {
      if (whole > (kMax - digit) / 10) return std::nullopt;
      whole = whole * 10 + digit;
    }
  }
  if (!seen_digit) return std::nullopt;
  if (fraction_digits == 1) fraction *= 10;
  return whole * 100 + fraction;
}

std::string format_amount(Cents amount) {
  const bool negative = amount < 0;
  const Cents abs = negative ? -amount : amount;
  std::string out = negative ? "-" : "";
  out += std::to_string(abs / 100);
  out += '.';
  const Cents frac = abs % 100;
  if (frac < 10) out += '0';
  out += std::to_string(frac);
  return out;
}

Cents apply_rate(Cents amount, std::int32_t rate_bp) noexcept {
  return (amount * rate_bp + 5000) / 10000;
}

}  // namespace tillpoint::core
