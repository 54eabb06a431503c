#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/sale/inventory_applier.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tillpoint::sale {

/// A decrement that did not reach the catalog for a settled transaction.
struct PendingDecrement {
  std::string transaction_id;
  std::string product_id;
  std::int32_t quantity{0};
  core::PosError last_error{core::PosError::None};
  int attempts{1};
};

/// Compensation record for partially applied checkouts. Entries stay pending
/// until an operator-triggered retry applies them; nothing retries on its own.
class ReconciliationLedger {
 public:
  /// Stores every status that was not applied.
  void record(const std::string& transaction_id,
              const std::vector<InventoryApplyStatus>& statuses);

  [[nodiscard]] std::vector<PendingDecrement> pending() const;
  [[nodiscard]] bool empty() const;

  /// Re-applies each pending decrement once; returns how many were resolved.
  std::size_t retry_pending(store::ICatalogStore& store);

 private:
  mutable std::mutex mutex_;
  std::vector<PendingDecrement> pending_;
};

}  // namespace tillpoint::sale
