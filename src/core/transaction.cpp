#include <tillpoint/core/transaction.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace tillpoint::core {

std::string_view to_string(PaymentMethod m) noexcept {
  switch (m) {
    case PaymentMethod::Cash:
      return "cash";
    case PaymentMethod::Card:
      return "card";
    case PaymentMethod::GCash:
      return "gcash";
  }
  return "cash";
}

std::optional<PaymentMethod> parse_payment_method(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "cash") return PaymentMethod::Cash;
  if (lower == "card") return PaymentMethod::Card;
  if (lower == "gcash") return PaymentMethod::GCash;
  return std::nullopt;
}

Totals totals_for(Cents subtotal, std::int32_t tax_rate_bp) noexcept {
  Totals t;
  t.subtotal = subtotal;
  t.tax = apply_rate(subtotal, tax_rate_bp);
  t.total = t.subtotal + t.tax;
  return t;
}

}  // namespace tillpoint::core
