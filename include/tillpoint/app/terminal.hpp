#pragma once

#include <tillpoint/app/config.hpp>
#include <tillpoint/catalog/catalog_cache.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/error.hpp>
#include <tillpoint/core/timer_queue.hpp>
#include <tillpoint/sale/cart.hpp>
#include <tillpoint/sale/checkout_pipeline.hpp>
#include <tillpoint/sale/payment.hpp>
#include <tillpoint/sale/reconciliation_ledger.hpp>
#include <tillpoint/scan/barcode_router.hpp>
#include <tillpoint/scan/handoff_mailbox.hpp>
#include <tillpoint/scan/key_event.hpp>
#include <tillpoint/scan/routing_context.hpp>
#include <tillpoint/scan/scan_decoder.hpp>
#include <tillpoint/scan/screen.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <tillpoint/store/transaction_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace tillpoint::app {

enum class Severity : std::uint8_t {
  Info,
  Success,
  Warning,
  Error,
};

[[nodiscard]] std::string_view to_string(Severity s) noexcept;

/// Operator-facing message (toast).
struct Notification {
  Severity severity{Severity::Info};
  std::string message;
};

using NotificationCallback = std::function<void(const Notification&)>;

/// One POS terminal: screens with their own scan state, the barcode router,
/// cart, checkout and catalog cache, driven by key events and a timer loop.
///
/// Single-threaded: on_key(), tick() and every other call must come from the
/// terminal's event loop. Only the inventory step of checkout fans out to
/// worker threads.
class Terminal {
 public:
  Terminal(TerminalConfig config,
           store::ICatalogStore& catalog,
           store::ITransactionStore& transactions,
           const core::IClock& clock);
  ~Terminal();

  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  void on_notification(NotificationCallback callback) { notify_ = std::move(callback); }

  /// Initial catalog load and, if configured, the periodic refresh timer.
  [[nodiscard]] std::expected<void, core::PosError> start();

  /// Switches the active screen. The old screen's partial scan is dropped.
  /// Entering the sale screen delivers a pending handoff product to the cart.
  void navigate(scan::Screen screen);
  [[nodiscard]] scan::Screen screen() const noexcept { return screen_; }

  /// Feeds a keydown to the product-form capture (when active) or the active screen's decoder.
  scan::KeyResult on_key(const scan::KeyEvent& event);

  /// Runs due timers; returns how many fired.
  std::size_t tick();

  /// Modal overlays suspend scanning on the active screen; calls nest.
  void suspend_scanning();
  void resume_scanning();

  /// Routes a token typed into the search box as if it had been scanned.
  std::expected<scan::RoutedAction, core::PosError> manual_scan(const std::string& token);

  /// Product grid tap: adds the cached product with this id.
  std::expected<sale::CartAddition, core::PosError> add_product(const std::string& product_id);

  std::expected<void, core::PosError> update_quantity(const std::string& product_id,
                                                      std::int32_t quantity);
  void remove_from_cart(const std::string& product_id);
  void clear_cart();

  [[nodiscard]] const sale::Cart& cart() const noexcept { return cart_; }
  [[nodiscard]] sale::PaymentInput& payment() noexcept { return payment_; }

  std::expected<sale::CheckoutReceipt, core::PosError> checkout();
  [[nodiscard]] sale::CheckoutState checkout_state() const noexcept { return pipeline_.state(); }

  /// Re-applies inventory decrements left over from partially applied checkouts.
  std::size_t retry_inventory_reconciliation();
  [[nodiscard]] const sale::ReconciliationLedger& ledger() const noexcept { return ledger_; }

  std::expected<bool, core::PosError> refresh_catalog(
      catalog::RefreshMode mode = catalog::RefreshMode::RateLimited);
  [[nodiscard]] const catalog::CatalogCache& cache() const noexcept { return cache_; }

  /// Product form (catalog screen). Opening suspends the owning screen's scanning until
  /// closed; navigating away from that screen closes the form.
  void open_product_form(std::string prefilled_barcode = {});
  void close_product_form();
  [[nodiscard]] bool product_form_open() const noexcept { return form_open_; }

  /// Arms the form's own barcode decoder; a captured token fills the barcode field.
  void start_form_barcode_capture();
  void stop_form_barcode_capture();
  [[nodiscard]] bool form_capturing() const noexcept { return form_capturing_; }
  [[nodiscard]] const std::string& form_barcode() const noexcept { return form_barcode_; }

  [[nodiscard]] scan::RoutingContext& routing_context(scan::Screen screen);
  [[nodiscard]] const scan::ScanDecoder& decoder(scan::Screen screen) const;
  [[nodiscard]] const TerminalConfig& config() const noexcept { return config_; }

 private:
  std::expected<scan::RoutedAction, core::PosError> handle_token(const std::string& token,
                                                                 scan::Screen screen);
  std::expected<sale::CartAddition, core::PosError> add_to_cart(const core::Product& product);
  void on_form_token(const std::string& token);
  void schedule_periodic_refresh();
  void notify(Severity severity, std::string message);
  [[nodiscard]] std::string product_name_for(const std::string& token) const;

  TerminalConfig config_;
  store::ICatalogStore& catalog_;
  const core::IClock& clock_;
  NotificationCallback notify_;

  core::TimerQueue timers_;
  catalog::CatalogCache cache_;
  scan::HandoffMailbox mailbox_;
  scan::BarcodeRouter router_;
  sale::Cart cart_;
  sale::ReconciliationLedger ledger_;
  sale::CheckoutPipeline pipeline_;
  sale::PaymentInput payment_;

  scan::Screen screen_{scan::Screen::Sale};
  std::unordered_map<scan::Screen, scan::RoutingContext> contexts_;
  std::unordered_map<scan::Screen, std::unique_ptr<scan::ScanDecoder>> decoders_;

  bool form_open_{false};
  scan::Screen form_owner_{scan::Screen::Catalog};
  std::string form_barcode_;
  scan::RoutingContext form_context_;
  std::unique_ptr<scan::ScanDecoder> form_decoder_;
  bool form_capturing_{false};

  std::optional<core::TimerId> refresh_timer_;
};

}  // namespace tillpoint::app
