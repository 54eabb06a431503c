#pragma once

#include <string_view>

namespace tillpoint::core {

/// Error codes for the transaction core; used with std::expected for recoverable failures.
enum class PosError {
  None = 0,
  InputDiscarded,             // filtered, suppressed or sub-threshold input; silent
  UnknownBarcode,
  OutOfStock,
  DuplicateBarcode,
  InsufficientStock,          // cart mutation rejected
  InvalidPayment,             // insufficient cash or missing reference
  EmptyCart,
  TransactionPersistFailure,  // checkout aborted, cart preserved
  InventoryApplyFailure,      // transaction committed, some decrements missing
  ProductNotFound,
  TransactionNotFound,
  StoreUnavailable,
  PermissionDenied,
  InvalidConfig,
};

/// Stable identifier, e.g. "InsufficientStock".
[[nodiscard]] std::string_view to_string(PosError e) noexcept;

/// Operator-facing classification of the error.
[[nodiscard]] std::string_view describe(PosError e) noexcept;

/// True for errors that signal possible divergence between stores and must be logged.
[[nodiscard]] constexpr bool needs_reconciliation(PosError e) noexcept {
  return e == PosError::TransactionPersistFailure ||
         e == PosError::InventoryApplyFailure;
}

}  // namespace tillpoint::core
