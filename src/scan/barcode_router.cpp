#include <tillpoint/scan/barcode_router.hpp>
#include <spdlog/spdlog.h>

namespace tillpoint::scan {

namespace {

class SaleScreenHandler : public IScreenHandler {
 public:
  std::expected<RoutedAction, core::PosError> handle(
      const std::string& token,
      const std::optional<core::Product>& match) override {
    if (!match) return std::unexpected(core::PosError::UnknownBarcode);
    if (match->quantity <= 0) return std::unexpected(core::PosError::OutOfStock);
    return RoutedAction{RouteKind::AddToCart, token, match};
  }
};

/// A known token on the catalog screen is a registration conflict; an unknown
/// one starts a new product.
class CatalogScreenHandler : public IScreenHandler {
 public:
  std::expected<RoutedAction, core::PosError> handle(
      const std::string& token,
      const std::optional<core::Product>& match) override {
    if (match) return std::unexpected(core::PosError::DuplicateBarcode);
    return RoutedAction{RouteKind::CreateProduct, token, std::nullopt};
  }
};

class HandoffHandler : public IScreenHandler {
 public:
  explicit HandoffHandler(HandoffMailbox& mailbox) : mailbox_(mailbox) {}

  std::expected<RoutedAction, core::PosError> handle(
      const std::string& token,
      const std::optional<core::Product>& match) override {
    if (!match) return std::unexpected(core::PosError::UnknownBarcode);
    if (match->quantity <= 0) return std::unexpected(core::PosError::OutOfStock);
    mailbox_.post(*match);
    return RoutedAction{RouteKind::HandoffToSale, token, match};
  }

 private:
  HandoffMailbox& mailbox_;
};

/// Clears the resolving flag and starts the processing hold on every exit path.
class InFlightGuard {
 public:
  InFlightGuard(bool& resolving, std::optional<core::TimePoint>& busy_until,
                const core::IClock& clock, core::Millis hold)
      : resolving_(resolving), busy_until_(busy_until), clock_(clock), hold_(hold) {
    resolving_ = true;
  }
  ~InFlightGuard() {
    resolving_ = false;
    busy_until_ = clock_.now() + hold_;
  }

  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  bool& resolving_;
  std::optional<core::TimePoint>& busy_until_;
  const core::IClock& clock_;
  core::Millis hold_;
};

}  // namespace

DedupPolicy DedupPolicy::standard() {
  DedupPolicy policy(core::Millis{2000});
  policy.set(Screen::Sale, core::Millis{500});
  return policy;
}

core::Millis DedupPolicy::window_for(Screen screen) const {
  const auto it = windows_.find(screen);
  return it != windows_.end() ? it->second : default_window_;
}

BarcodeRouter::BarcodeRouter(const catalog::CatalogCache& cache,
                             HandoffMailbox& mailbox,
                             const core::IClock& clock,
                             RouterOptions options)
    : cache_(cache),
      clock_(clock),
      options_(std::move(options)),
      sale_handler_(std::make_unique<SaleScreenHandler>()),
      catalog_handler_(std::make_unique<CatalogScreenHandler>()),
      handoff_handler_(std::make_unique<HandoffHandler>(mailbox)) {}

bool BarcodeRouter::in_flight() const {
  return resolving_ || (busy_until_ && clock_.now() < *busy_until_);
}

IScreenHandler& BarcodeRouter::handler_for(Screen screen) {
  switch (screen) {
    case Screen::Sale:
      return *sale_handler_;
    case Screen::Catalog:
      return *catalog_handler_;
    default:
      return *handoff_handler_;
  }
}

std::expected<RoutedAction, core::PosError> BarcodeRouter::route(
    const std::string& token,
    Screen screen,
    RoutingContext& context) {
  const core::TimePoint now = clock_.now();
  const core::Millis window = options_.dedup.window_for(screen);

  if (in_flight() || context.is_duplicate(token, now, window)) {
    spdlog::debug("[router] skipped duplicate or in-flight token '{}' on {}", token,
                  to_string(screen));
    return std::unexpected(core::PosError::InputDiscarded);
  }

  InFlightGuard guard(resolving_, busy_until_, clock_, options_.processing_hold);
  context.remember(token, now);

  const auto match = cache_.find_by_token(token);
  auto result = handler_for(screen).handle(token, match);
  if (result) {
    spdlog::info("[router] '{}' on {} -> {}", token, to_string(screen),
                 match ? match->name : std::string("new product"));
  } else {
    spdlog::info("[router] '{}' on {} rejected: {}", token, to_string(screen),
                 core::to_string(result.error()));
  }
  return result;
}

}  // namespace tillpoint::scan
