#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/transaction.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tillpoint::sale {

/// Outcome of one decrement request.
struct InventoryApplyStatus {
  std::string product_id;
  std::int32_t requested{0};
  std::optional<std::int32_t> before;  // stock read just before the write
  std::optional<std::int32_t> after;   // stock written
  bool applied{false};
  core::PosError error{core::PosError::None};
};

/// Read current stock, write max(0, current - quantity). Not atomic: another
/// writer can change the stock between the read and the write.
[[nodiscard]] InventoryApplyStatus apply_decrement(store::ICatalogStore& store,
                                                   const std::string& product_id,
                                                   std::int32_t quantity);

/// Issues one apply_decrement per line concurrently on the TBB scheduler.
/// Lines are independent: no ordering between them and no rollback when some
/// fail. Result i belongs to lines[i]. The store must be thread-safe.
[[nodiscard]] std::vector<InventoryApplyStatus> apply_inventory_decrements(
    store::ICatalogStore& store,
    const std::vector<core::TransactionLine>& lines);

}  // namespace tillpoint::sale
