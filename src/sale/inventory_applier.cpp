#include <tillpoint/sale/inventory_applier.hpp>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <algorithm>
#include <cstddef>

namespace tillpoint::sale {

InventoryApplyStatus apply_decrement(store::ICatalogStore& store,
                                     const std::string& product_id,
                                     std::int32_t quantity) {
  InventoryApplyStatus status;
  status.product_id = product_id;
  status.requested = quantity;

  auto current = store.get_product(product_id);
  if (!current) {
    status.error = current.error();
    spdlog::error("[inventory] read of {} failed: {}", product_id,
                  core::to_string(current.error()));
    return status;
  }
  status.before = current->quantity;

  core::ProductPatch patch;
  patch.quantity = std::max<std::int32_t>(0, current->quantity - quantity);
  auto updated = store.update_product(product_id, patch);
  if (!updated) {
    status.error = updated.error();
    spdlog::error("[inventory] write of {} failed: {}", product_id,
                  core::to_string(updated.error()));
    return status;
  }

  status.after = updated->quantity;
  status.applied = true;
  spdlog::debug("[inventory] {}: {} -> {}", product_id, *status.before, *status.after);
  return status;
}

std::vector<InventoryApplyStatus> apply_inventory_decrements(
    store::ICatalogStore& store,
    const std::vector<core::TransactionLine>& lines) {
  std::vector<InventoryApplyStatus> results(lines.size());
  if (lines.empty()) return results;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, lines.size(), 1),
      [&store, &lines, &results](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          results[i] = apply_decrement(store, lines[i].product_id, lines[i].quantity);
        }
      });
  return results;
}

}  // namespace tillpoint::sale
