#include <tillpoint/core/error.hpp>

namespace tillpoint::core {

std::string_view to_string(PosError e) noexcept {
  switch (e) {
    case PosError::None:
      return "None";
    case PosError::InputDiscarded:
      return "InputDiscarded";
    case PosError::UnknownBarcode:
      return "UnknownBarcode";
    case PosError::OutOfStock:
      return "OutOfStock";
    case PosError::DuplicateBarcode:
      return "DuplicateBarcode";
    case PosError::InsufficientStock:
      return "InsufficientStock";
    case PosError::InvalidPayment:
      return "InvalidPayment";
    case PosError::EmptyCart:
      return "EmptyCart";
    case PosError::TransactionPersistFailure:
      return "TransactionPersistFailure";
    case PosError::InventoryApplyFailure:
      return "InventoryApplyFailure";
    case PosError::ProductNotFound:
      return "ProductNotFound";
    case PosError::TransactionNotFound:
      return "TransactionNotFound";
    case PosError::StoreUnavailable:
      return "StoreUnavailable";
    case PosError::PermissionDenied:
      return "PermissionDenied";
    case PosError::InvalidConfig:
      return "InvalidConfig";
  }
  return "Unknown";
}

std::string_view describe(PosError e) noexcept {
  switch (e) {
    case PosError::None:
      return "ok";
    case PosError::InputDiscarded:
      return "input discarded";
    case PosError::UnknownBarcode:
      return "barcode not found in catalog";
    case PosError::OutOfStock:
      return "product is out of stock";
    case PosError::DuplicateBarcode:
      return "barcode already registered to a product";
    case PosError::InsufficientStock:
      return "insufficient stock for requested quantity";
    case PosError::InvalidPayment:
      return "invalid payment";
    case PosError::EmptyCart:
      return "cart is empty";
    case PosError::TransactionPersistFailure:
      return "failed to save transaction; cart kept, retry checkout";
    case PosError::InventoryApplyFailure:
      return "transaction saved but inventory update incomplete; reconcile stock";
    case PosError::ProductNotFound:
      return "product not found";
    case PosError::TransactionNotFound:
      return "transaction not found";
    case PosError::StoreUnavailable:
      return "store unavailable";
    case PosError::PermissionDenied:
      return "permission denied";
    case PosError::InvalidConfig:
      return "invalid configuration";
  }
  return "unknown error";
}

}  // namespace tillpoint::core
