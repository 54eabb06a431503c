#pragma once

#include <tillpoint/catalog/catalog_cache.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/error.hpp>
#include <tillpoint/core/transaction.hpp>
#include <tillpoint/sale/cart.hpp>
#include <tillpoint/sale/inventory_applier.hpp>
#include <tillpoint/sale/payment.hpp>
#include <tillpoint/sale/reconciliation_ledger.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <tillpoint/store/transaction_store.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tillpoint::sale {

enum class CheckoutState : std::uint8_t {
  Collecting,
  Validating,
  PersistingTx,
  ApplyingInventory,
  Settled,
};

[[nodiscard]] std::string_view to_string(CheckoutState s) noexcept;

/// A committed sale. inventory holds one status per transaction line.
struct CheckoutReceipt {
  core::Transaction transaction;
  std::vector<InventoryApplyStatus> inventory;

  [[nodiscard]] bool inventory_complete() const;

  /// InventoryApplyFailure if any decrement did not apply.
  [[nodiscard]] std::optional<core::PosError> inventory_error() const;
};

/// Builds the transaction snapshot for a cart. Does not modify the cart.
[[nodiscard]] core::Transaction build_transaction(const Cart& cart,
                                                  const PaymentSettlement& payment,
                                                  std::string id,
                                                  std::string timestamp);

/// Commits a cart: validate payment, persist the transaction, apply inventory
/// decrements, force a cache refresh, clear the cart.
///
/// Empty cart, invalid payment and persist failure return an error and leave
/// the cart untouched (state back to Collecting). Once the transaction is
/// persisted the sale is settled even if some decrements fail; those are
/// recorded in the ledger and reported through the receipt.
class CheckoutPipeline {
 public:
  CheckoutPipeline(store::ITransactionStore& transactions,
                   store::ICatalogStore& catalog,
                   catalog::CatalogCache& cache,
                   ReconciliationLedger& ledger,
                   const core::IClock& clock);

  [[nodiscard]] std::expected<CheckoutReceipt, core::PosError> checkout(
      Cart& cart, const PaymentInput& payment);

  [[nodiscard]] CheckoutState state() const noexcept { return state_; }

 private:
  [[nodiscard]] std::string next_transaction_id();

  store::ITransactionStore& transactions_;
  store::ICatalogStore& catalog_;
  catalog::CatalogCache& cache_;
  ReconciliationLedger& ledger_;
  const core::IClock& clock_;

  CheckoutState state_{CheckoutState::Collecting};
  long long last_id_millis_{-1};
  int id_collisions_{0};
};

}  // namespace tillpoint::sale
