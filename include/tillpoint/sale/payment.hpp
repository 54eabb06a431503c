#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/transaction.hpp>
#include <expected>
#include <optional>
#include <string>

namespace tillpoint::sale {

/// Payment fields as entered by the operator.
struct PaymentInput {
  core::PaymentMethod method{core::PaymentMethod::Cash};
  std::string received_amount;   // cash only; decimal text
  std::string reference_number;  // card / gcash only

  void reset() {
    received_amount.clear();
    reference_number.clear();
  }
};

struct PaymentSettlement {
  core::PaymentMethod method{core::PaymentMethod::Cash};
  core::Cents received{0};
  core::Cents change{0};
  std::optional<std::string> reference_number;
};

/// Cash: received must parse and cover total; change = received - total.
/// Card / GCash: trimmed reference required; received = total, change = 0.
/// Any failure is InvalidPayment.
[[nodiscard]] std::expected<PaymentSettlement, core::PosError> validate_payment(
    const PaymentInput& input, core::Cents total);

}  // namespace tillpoint::sale
