#pragma once

#include <tillpoint/catalog/catalog_cache.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/error.hpp>
#include <tillpoint/core/product.hpp>
#include <tillpoint/scan/handoff_mailbox.hpp>
#include <tillpoint/scan/routing_context.hpp>
#include <tillpoint/scan/screen.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace tillpoint::scan {

enum class RouteKind : std::uint8_t {
  AddToCart,      // sale screen: add product to the cart
  HandoffToSale,  // product posted to the mailbox; navigate to the sale screen
  CreateProduct,  // catalog screen: open the product form with the token pre-filled
};

struct RoutedAction {
  RouteKind kind{RouteKind::AddToCart};
  std::string token;
  std::optional<core::Product> product;
};

/// Duplicate-suppression window per screen; screens without an entry use the default.
class DedupPolicy {
 public:
  explicit DedupPolicy(core::Millis default_window) : default_window_(default_window) {}

  /// Sale 500 ms, everything else 2000 ms.
  [[nodiscard]] static DedupPolicy standard();

  void set(Screen screen, core::Millis window) { windows_[screen] = window; }
  [[nodiscard]] core::Millis window_for(Screen screen) const;

 private:
  core::Millis default_window_;
  std::unordered_map<Screen, core::Millis> windows_;
};

struct RouterOptions {
  DedupPolicy dedup{DedupPolicy::standard()};
  core::Millis processing_hold{300};  // resolution counts as in flight this long after it finishes
};

/// Screen-specific outcome for a resolved (or unresolved) token.
class IScreenHandler {
 public:
  virtual ~IScreenHandler() = default;

  [[nodiscard]] virtual std::expected<RoutedAction, core::PosError> handle(
      const std::string& token,
      const std::optional<core::Product>& match) = 0;
};

/// Resolves tokens against the catalog cache and dispatches them to the
/// handler of the active screen. Duplicates within the screen's dedup window
/// and tokens arriving while another resolution is in flight are dropped
/// with InputDiscarded.
class BarcodeRouter {
 public:
  BarcodeRouter(const catalog::CatalogCache& cache,
                HandoffMailbox& mailbox,
                const core::IClock& clock,
                RouterOptions options = {});

  [[nodiscard]] std::expected<RoutedAction, core::PosError> route(
      const std::string& token,
      Screen screen,
      RoutingContext& context);

  [[nodiscard]] bool in_flight() const;

  [[nodiscard]] const RouterOptions& options() const noexcept { return options_; }

 private:
  [[nodiscard]] IScreenHandler& handler_for(Screen screen);

  const catalog::CatalogCache& cache_;
  const core::IClock& clock_;
  RouterOptions options_;

  std::unique_ptr<IScreenHandler> sale_handler_;
  std::unique_ptr<IScreenHandler> catalog_handler_;
  std::unique_ptr<IScreenHandler> handoff_handler_;

  bool resolving_{false};
  std::optional<core::TimePoint> busy_until_;
};

}  // namespace tillpoint::scan
