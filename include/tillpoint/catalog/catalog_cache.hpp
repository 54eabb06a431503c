#pragma once

#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/error.hpp>
#include <tillpoint/core/product.hpp>
#include <tillpoint/store/catalog_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tillpoint::catalog {

enum class RefreshMode : std::uint8_t {
  RateLimited,  // skipped if the previous refresh is younger than the minimum interval
  Forced,
};

/// In-memory mirror of the catalog store, replaced wholesale on refresh.
/// Reads return copies; callers must treat them as possibly stale.
class CatalogCache {
 public:
  CatalogCache(store::ICatalogStore& store,
               const core::IClock& clock,
               core::Millis min_refresh_interval);

  /// true = refreshed, false = skipped by the rate limit. On store failure the
  /// previous content is kept and the error returned.
  [[nodiscard]] std::expected<bool, core::PosError> refresh(
      RefreshMode mode = RefreshMode::RateLimited);

  [[nodiscard]] std::vector<core::Product> snapshot() const;

  /// Barcode match first (lowest product id wins among duplicates), then id match.
  [[nodiscard]] std::optional<core::Product> find_by_token(std::string_view token) const;

  [[nodiscard]] std::optional<core::Product> find_by_barcode(std::string_view barcode) const;

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::optional<core::TimePoint> last_refresh() const;

  void set_min_refresh_interval(core::Millis interval);

 private:
  [[nodiscard]] std::optional<core::Product> find_by_barcode_locked(std::string_view barcode) const;

  store::ICatalogStore& store_;
  const core::IClock& clock_;
  core::Millis min_refresh_interval_;

  mutable std::mutex mutex_;
  std::vector<core::Product> products_;
  std::optional<core::TimePoint> last_refresh_;
};

}  // namespace tillpoint::catalog
