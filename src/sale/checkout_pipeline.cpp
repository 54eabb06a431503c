#include <tillpoint/sale/checkout_pipeline.hpp>
#include <tillpoint/core/money.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace tillpoint::sale {

std::string_view to_string(CheckoutState s) noexcept {
  switch (s) {
    case CheckoutState::Collecting: return "collecting";
    case CheckoutState::Validating: return "validating";
    case CheckoutState::PersistingTx: return "persisting";
    case CheckoutState::ApplyingInventory: return "applying-inventory";
    case CheckoutState::Settled: return "settled";
  }
  return "unknown";
}

bool CheckoutReceipt::inventory_complete() const {
  return std::all_of(inventory.begin(), inventory.end(),
                     [](const InventoryApplyStatus& s) { return s.applied; });
}

std::optional<core::PosError> CheckoutReceipt::inventory_error() const {
  if (inventory_complete()) return std::nullopt;
  return core::PosError::InventoryApplyFailure;
}

core::Transaction build_transaction(const Cart& cart,
                                    const PaymentSettlement& payment,
                                    std::string id,
                                    std::string timestamp) {
  core::Transaction t;
  t.id = std::move(id);
  t.timestamp = std::move(timestamp);
  t.items.reserve(cart.size());
  for (const auto& line : cart.lines()) {
    t.items.push_back(core::TransactionLine{line.product_id, line.name, line.category,
                                            line.unit_price, line.quantity, line.line_total()});
  }
  const core::Totals totals = cart.totals();
  t.subtotal = totals.subtotal;
  t.tax = totals.tax;
  t.total = totals.total;
  t.payment_method = payment.method;
  t.received_amount = payment.received;
  t.change = payment.change;
  t.reference_number = payment.reference_number;
  return t;
}

CheckoutPipeline::CheckoutPipeline(store::ITransactionStore& transactions,
                                   store::ICatalogStore& catalog,
                                   catalog::CatalogCache& cache,
                                   ReconciliationLedger& ledger,
                                   const core::IClock& clock)
    : transactions_(transactions),
      catalog_(catalog),
      cache_(cache),
      ledger_(ledger),
      clock_(clock) {}

std::string CheckoutPipeline::next_transaction_id() {
  const long long ms = core::epoch_millis(clock_.wall_now());
  if (ms == last_id_millis_) {
    ++id_collisions_;
    return "TXN-" + std::to_string(ms) + "-" + std::to_string(id_collisions_);
  }
  last_id_millis_ = ms;
  id_collisions_ = 0;
  return "TXN-" + std::to_string(ms);
}

std::expected<CheckoutReceipt, core::PosError> CheckoutPipeline::checkout(
    Cart& cart, const PaymentInput& payment) {
  state_ = CheckoutState::Validating;
  if (cart.empty()) {
    state_ = CheckoutState::Collecting;
    return std::unexpected(core::PosError::EmptyCart);
  }

  const core::Totals totals = cart.totals();
  auto settlement = validate_payment(payment, totals.total);
  if (!settlement) {
    state_ = CheckoutState::Collecting;
    return std::unexpected(settlement.error());
  }

  CheckoutReceipt receipt;
  receipt.transaction = build_transaction(cart, *settlement, next_transaction_id(),
                                          core::format_iso8601_utc(clock_.wall_now()));

  state_ = CheckoutState::PersistingTx;
  auto persisted = transactions_.create_transaction(receipt.transaction);
  if (!persisted) {
    spdlog::error("[checkout] {} not persisted ({}); nothing applied, cart kept",
                  receipt.transaction.id, core::to_string(persisted.error()));
    state_ = CheckoutState::Collecting;
    return std::unexpected(core::PosError::TransactionPersistFailure);
  }

  state_ = CheckoutState::ApplyingInventory;
  receipt.inventory = apply_inventory_decrements(catalog_, receipt.transaction.items);
  if (!receipt.inventory_complete()) {
    spdlog::error("[checkout] {} committed with incomplete inventory; see reconciliation ledger",
                  receipt.transaction.id);
    ledger_.record(receipt.transaction.id, receipt.inventory);
  }

  if (auto refreshed = cache_.refresh(catalog::RefreshMode::Forced); !refreshed) {
    spdlog::warn("[checkout] catalog refresh after {} failed: {}", receipt.transaction.id,
                 core::to_string(refreshed.error()));
  }

  state_ = CheckoutState::Settled;
  cart.clear();
  spdlog::info("[checkout] {} settled: total {} via {}", receipt.transaction.id,
               core::format_amount(receipt.transaction.total),
               core::to_string(receipt.transaction.payment_method));
  return receipt;
}

}  // namespace tillpoint::sale
