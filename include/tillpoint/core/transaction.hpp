#pragma once

#include <tillpoint/core/money.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tillpoint::core {

/// Closed set of accepted tenders.
enum class PaymentMethod : std::uint8_t {
  Cash,
  Card,
  GCash,
};

[[nodiscard]] std::string_view to_string(PaymentMethod m) noexcept;

/// Accepts "cash", "card", "gcash" (case-insensitive).
[[nodiscard]] std::optional<PaymentMethod> parse_payment_method(std::string_view text);

/// Derived sale amounts. total == subtotal + tax always holds.
struct Totals {
  Cents subtotal{0};
  Cents tax{0};
  Cents total{0};
};

[[nodiscard]] Totals totals_for(Cents subtotal, std::int32_t tax_rate_bp) noexcept;

/// Line snapshot inside a committed transaction.
struct TransactionLine {
  std::string product_id;
  std::string name;
  std::string category;
  Cents unit_price{0};
  std::int32_t quantity{0};
  Cents subtotal{0};
};

/// Immutable record of a committed sale.
struct Transaction {
  std::string id;
  std::string timestamp;  // ISO-8601 UTC
  std::vector<TransactionLine> items;
  Cents subtotal{0};
  Cents tax{0};
  Cents total{0};
  PaymentMethod payment_method{PaymentMethod::Cash};
  Cents received_amount{0};
  Cents change{0};
  std::optional<std::string> reference_number;
};

/// Operator roles as supplied by the auth collaborator.
enum class Role : std::uint8_t {
  Admin,
  Staff,
};

}  // namespace tillpoint::core
