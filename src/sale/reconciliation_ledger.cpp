#include <tillpoint/sale/reconciliation_ledger.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace tillpoint::sale {

void ReconciliationLedger::record(const std::string& transaction_id,
                                  const std::vector<InventoryApplyStatus>& statuses) {
  std::lock_guard lock(mutex_);
  for (const auto& s : statuses) {
    if (s.applied) continue;
    pending_.push_back(PendingDecrement{transaction_id, s.product_id, s.requested, s.error, 1});
    spdlog::error("[reconcile] {} pending: {} x{} ({})", transaction_id, s.product_id,
                  s.requested, core::to_string(s.error));
  }
}

std::vector<PendingDecrement> ReconciliationLedger::pending() const {
  std::lock_guard lock(mutex_);
  return pending_;
}

bool ReconciliationLedger::empty() const {
  std::lock_guard lock(mutex_);
  return pending_.empty();
}

std::size_t ReconciliationLedger::retry_pending(store::ICatalogStore& store) {
  std::lock_guard lock(mutex_);
  std::size_t resolved = 0;
  std::vector<PendingDecrement> still_pending;
  for (auto& entry : pending_) {
    const auto status = apply_decrement(store, entry.product_id, entry.quantity);
    if (status.applied) {
      ++resolved;
      spdlog::info("[reconcile] {} resolved: {} x{}", entry.transaction_id, entry.product_id,
                   entry.quantity);
      continue;
    }
    entry.last_error = status.error;
    ++entry.attempts;
    still_pending.push_back(std::move(entry));
  }
  pending_ = std::move(still_pending);
  return resolved;
}

}  // namespace tillpoint::sale
