#include <tillpoint/sale/payment.hpp>
#include <tillpoint/core/text.hpp>

namespace tillpoint::sale {

std::expected<PaymentSettlement, core::PosError> validate_payment(
    const PaymentInput& input, core::Cents total) {
  PaymentSettlement s;
  s.method = input.method;

  if (input.method == core::PaymentMethod::Cash) {
    const auto received = core::parse_amount(input.received_amount);
    if (!received || *received < total) {
      return std::unexpected(core::PosError::InvalidPayment);
    }
    s.received = *received;
    s.change = *received - total;
    return s;
  }

  std::string reference = core::trim_copy(input.reference_number);
  if (reference.empty()) {
    return std::unexpected(core::PosError::InvalidPayment);
  }
  s.received = total;
  s.change = 0;
  s.reference_number = std::move(reference);
  return s;
}

}  // namespace tillpoint::sale
