#include <tillpoint/app/terminal.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/product.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <array>
#include <utility>

namespace tillpoint::app {

namespace {

constexpr std::array kScreens = {
    scan::Screen::Sale,         scan::Screen::Catalog, scan::Screen::Dashboard,
    scan::Screen::SalesHistory, scan::Screen::Reports, scan::Screen::Settings,
};

scan::RouterOptions router_options(const TerminalConfig& c) {
  scan::RouterOptions options;
  options.dedup = scan::DedupPolicy(core::Millis{c.dedup_default_ms});
  options.dedup.set(scan::Screen::Sale, core::Millis{c.dedup_sale_ms});
  options.processing_hold = core::Millis{c.processing_hold_ms};
  return options;
}

scan::DecoderOptions page_decoder_options(const TerminalConfig& c) {
  scan::DecoderOptions options = scan::DecoderOptions::global();
  options.inactivity = core::Millis{c.scan_inactivity_ms};
  options.min_length = c.min_token_length;
  return options;
}

scan::DecoderOptions form_decoder_options(const TerminalConfig& c) {
  scan::DecoderOptions options = scan::DecoderOptions::product_form();
  options.inactivity = core::Millis{c.form_scan_inactivity_ms};
  options.min_length = c.form_min_token_length;
  return options;
}

}  // namespace

std::string_view to_string(Severity s) noexcept {
  switch (s) {
    case Severity::Info: return "info";
    case Severity::Success: return "success";
    case Severity::Warning: return "warning";
    case Severity::Error: return "error";
  }
  return "unknown";
}

Terminal::Terminal(TerminalConfig config,
                   store::ICatalogStore& catalog,
                   store::ITransactionStore& transactions,
                   const core::IClock& clock)
    : config_(std::move(config)),
      catalog_(catalog),
      clock_(clock),
      timers_(clock),
      cache_(catalog, clock, core::Millis{config_.cache_min_refresh_interval_ms}),
      mailbox_(clock, core::Millis{config_.handoff_grace_ms}),
      router_(cache_, mailbox_, clock, router_options(config_)),
      cart_(catalog, config_.tax_rate_bp),
      pipeline_(transactions, catalog, cache_, ledger_, clock) {
  for (const scan::Screen s : kScreens) {
    contexts_.try_emplace(s);
  }
  for (const scan::Screen s : kScreens) {
    decoders_[s] = std::make_unique<scan::ScanDecoder>(
        page_decoder_options(config_), timers_, contexts_.at(s),
        [this, s](const std::string& token) { (void)handle_token(token, s); });
  }
  form_decoder_ = std::make_unique<scan::ScanDecoder>(
      form_decoder_options(config_), timers_, form_context_,
      [this](const std::string& token) { on_form_token(token); });
}

Terminal::~Terminal() {
  if (refresh_timer_) timers_.cancel(*refresh_timer_);
}

std::expected<void, core::PosError> Terminal::start() {
  auto loaded = cache_.refresh(catalog::RefreshMode::Forced);
  if (!loaded) {
    notify(Severity::Error, fmt::format("Could not load catalog: {}", core::describe(loaded.error())));
    return std::unexpected(loaded.error());
  }
  spdlog::info("[terminal] started with {} products", cache_.size());
  schedule_periodic_refresh();
  return {};
}

void Terminal::schedule_periodic_refresh() {
  if (config_.cache_refresh_period_ms == 0) return;
  refresh_timer_ = timers_.schedule_after(core::Millis{config_.cache_refresh_period_ms}, [this]() {
    refresh_timer_.reset();
    (void)refresh_catalog(catalog::RefreshMode::RateLimited);
    schedule_periodic_refresh();
  });
}

void Terminal::navigate(scan::Screen screen) {
  if (screen != screen_) {
    if (form_open_ && screen != form_owner_) {
      close_product_form();
    }
    decoders_.at(screen_)->reset();
    spdlog::debug("[terminal] {} -> {}", to_string(screen_), to_string(screen));
    screen_ = screen;
  }
  if (screen_ != scan::Screen::Sale) return;

  if (auto handed_off = mailbox_.consume()) {
    (void)add_to_cart(*handed_off);
  }
}

scan::KeyResult Terminal::on_key(const scan::KeyEvent& event) {
  if (form_capturing_) {
    return form_decoder_->on_key(event);
  }
  return decoders_.at(screen_)->on_key(event);
}

std::size_t Terminal::tick() {
  return timers_.run_due();
}

void Terminal::suspend_scanning() {
  contexts_.at(screen_).suspend();
}

void Terminal::resume_scanning() {
  contexts_.at(screen_).resume();
}

scan::RoutingContext& Terminal::routing_context(scan::Screen screen) {
  return contexts_.at(screen);
}

const scan::ScanDecoder& Terminal::decoder(scan::Screen screen) const {
  return *decoders_.at(screen);
}

std::expected<scan::RoutedAction, core::PosError> Terminal::manual_scan(const std::string& token) {
  return handle_token(token, screen_);
}

std::expected<scan::RoutedAction, core::PosError> Terminal::handle_token(const std::string& token,
                                                                         scan::Screen screen) {
  auto routed = router_.route(token, screen, contexts_.at(screen));
  if (!routed) {
    switch (routed.error()) {
      case core::PosError::InputDiscarded:
        break;
      case core::PosError::UnknownBarcode:
        notify(Severity::Error, fmt::format("Product not found: {}", token));
        break;
      case core::PosError::OutOfStock:
        notify(Severity::Error, fmt::format("{} is out of stock", product_name_for(token)));
        break;
      case core::PosError::DuplicateBarcode:
        notify(Severity::Warning,
               fmt::format("Barcode {} is already registered to {}", token, product_name_for(token)));
        break;
      default:
        notify(Severity::Error, std::string(core::describe(routed.error())));
        break;
    }
    return routed;
  }

  switch (routed->kind) {
    case scan::RouteKind::AddToCart:
      (void)add_to_cart(*routed->product);
      break;
    case scan::RouteKind::HandoffToSale:
      navigate(scan::Screen::Sale);
      break;
    case scan::RouteKind::CreateProduct:
      notify(Severity::Info, fmt::format("New barcode {}: create a product", token));
      open_product_form(token);
      break;
  }
  return routed;
}

std::expected<sale::CartAddition, core::PosError> Terminal::add_product(const std::string& product_id) {
  const auto cached = cache_.find_by_token(product_id);
  if (!cached || cached->id != product_id) {
    notify(Severity::Error, fmt::format("Product not found: {}", product_id));
    return std::unexpected(core::PosError::ProductNotFound);
  }
  return add_to_cart(*cached);
}

std::expected<sale::CartAddition, core::PosError> Terminal::add_to_cart(const core::Product& product) {
  auto added = cart_.add(product);
  if (!added) {
    if (added.error() == core::PosError::InsufficientStock) {
      notify(Severity::Error, fmt::format("Not enough stock for {}", product.name));
    } else {
      notify(Severity::Error, fmt::format("Could not add {}: {}", product.name,
                                          core::describe(added.error())));
    }
    return added;
  }

  notify(Severity::Success, fmt::format("Added {} to cart", added->line.name));
  if (added->stock == core::StockStatus::LowStock) {
    notify(Severity::Warning,
           fmt::format("Low stock: {} ({} left)", added->line.name, added->available));
  }
  return added;
}

std::expected<void, core::PosError> Terminal::update_quantity(const std::string& product_id,
                                                              std::int32_t quantity) {
  auto updated = cart_.update_quantity(product_id, quantity);
  if (!updated) {
    notify(Severity::Error, std::string(core::describe(updated.error())));
  }
  return updated;
}

void Terminal::remove_from_cart(const std::string& product_id) {
  cart_.remove(product_id);
}

void Terminal::clear_cart() {
  cart_.clear();
  payment_.reset();
}

std::expected<sale::CheckoutReceipt, core::PosError> Terminal::checkout() {
  auto receipt = pipeline_.checkout(cart_, payment_);
  if (!receipt) {
    notify(Severity::Error, fmt::format("Checkout failed: {}", core::describe(receipt.error())));
    return receipt;
  }

  payment_.reset();
  const core::Transaction& t = receipt->transaction;
  if (receipt->inventory_error()) {
    notify(Severity::Warning,
           fmt::format("Sale {} recorded: {}", t.id,
                       core::describe(core::PosError::InventoryApplyFailure)));
  } else if (t.payment_method == core::PaymentMethod::Cash) {
    notify(Severity::Success,
           fmt::format("Sale {} completed. Change: {}", t.id, core::format_amount(t.change)));
  } else {
    notify(Severity::Success, fmt::format("Sale {} completed", t.id));
  }
  return receipt;
}

std::size_t Terminal::retry_inventory_reconciliation() {
  if (ledger_.empty()) return 0;
  const std::size_t resolved = ledger_.retry_pending(catalog_);
  if (resolved > 0) {
    (void)refresh_catalog(catalog::RefreshMode::Forced);
  }
  const std::size_t remaining = ledger_.pending().size();
  if (remaining == 0) {
    notify(Severity::Success, fmt::format("Inventory reconciled ({} updates applied)", resolved));
  } else {
    notify(Severity::Warning, fmt::format("{} inventory updates still pending", remaining));
  }
  return resolved;
}

std::expected<bool, core::PosError> Terminal::refresh_catalog(catalog::RefreshMode mode) {
  return cache_.refresh(mode);
}

void Terminal::open_product_form(std::string prefilled_barcode) {
  if (form_open_) return;
  form_open_ = true;
  form_barcode_ = std::move(prefilled_barcode);
  form_owner_ = screen_;
  contexts_.at(form_owner_).suspend();
}

void Terminal::close_product_form() {
  if (!form_open_) return;
  stop_form_barcode_capture();
  form_open_ = false;
  contexts_.at(form_owner_).resume();
}

void Terminal::start_form_barcode_capture() {
  if (!form_open_ || form_capturing_) return;
  form_decoder_->reset();
  form_capturing_ = true;
  notify(Severity::Info, "Barcode scanning started. Scan or type barcode.");
}

void Terminal::stop_form_barcode_capture() {
  if (!form_capturing_) return;
  form_decoder_->reset();
  form_capturing_ = false;
}

void Terminal::on_form_token(const std::string& token) {
  form_barcode_ = token;
  stop_form_barcode_capture();
  notify(Severity::Success, "Barcode scanned successfully!");
}

std::string Terminal::product_name_for(const std::string& token) const {
  const auto product = cache_.find_by_token(token);
  return product ? product->name : token;
}

void Terminal::notify(Severity severity, std::string message) {
  if (severity == Severity::Error) {
    spdlog::warn("[terminal] {}", message);
  } else {
    spdlog::info("[terminal] {}", message);
  }
  if (notify_) notify_(Notification{severity, std::move(message)});
}

}  // namespace tillpoint::app
