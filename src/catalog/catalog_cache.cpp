#include <tillpoint/catalog/catalog_cache.hpp>
#include <spdlog/spdlog.h>

namespace tillpoint::catalog {

CatalogCache::CatalogCache(store::ICatalogStore& store,
                           const core::IClock& clock,
                           core::Millis min_refresh_interval)
    : store_(store), clock_(clock), min_refresh_interval_(min_refresh_interval) {}

std::expected<bool, core::PosError> CatalogCache::refresh(RefreshMode mode) {
  const core::TimePoint now = clock_.now();
  {
    std::lock_guard lock(mutex_);
    if (mode == RefreshMode::RateLimited && last_refresh_ &&
        now - *last_refresh_ < min_refresh_interval_) {
      spdlog::debug("[catalog] refresh skipped, last refresh too recent");
      return false;
    }
  }

  auto listed = store_.list_products();
  if (!listed) {
    spdlog::warn("[catalog] refresh failed: {}", core::to_string(listed.error()));
    return std::unexpected(listed.error());
  }

  std::lock_guard lock(mutex_);
  products_ = std::move(*listed);
  last_refresh_ = now;
  spdlog::debug("[catalog] refreshed, {} products", products_.size());
  return true;
}

std::vector<core::Product> CatalogCache::snapshot() const {
  std::lock_guard lock(mutex_);
  return products_;
}

std::optional<core::Product> CatalogCache::find_by_barcode_locked(
    std::string_view barcode) const {
  const core::Product* best = nullptr;
  for (const auto& p : products_) {
    if (p.barcode && *p.barcode == barcode) {
      if (!best || p.id < best->id) best = &p;
    }
  }
  if (best) return *best;
  return std::nullopt;
}

std::optional<core::Product> CatalogCache::find_by_barcode(std::string_view barcode) const {
  std::lock_guard lock(mutex_);
  return find_by_barcode_locked(barcode);
}

std::optional<core::Product> CatalogCache::find_by_token(std::string_view token) const {
  std::lock_guard lock(mutex_);
  if (auto by_barcode = find_by_barcode_locked(token)) return by_barcode;
  for (const auto& p : products_) {
    if (p.id == token) return p;
  }
  return std::nullopt;
}

std::size_t CatalogCache::size() const {
  std::lock_guard lock(mutex_);
  return products_.size();
}

std::optional<core::TimePoint> CatalogCache::last_refresh() const {
  std::lock_guard lock(mutex_);
  return last_refresh_;
}

void CatalogCache::set_min_refresh_interval(core::Millis interval) {
  std::lock_guard lock(mutex_);
  min_refresh_interval_ = interval;
}

}  // namespace tillpoint::catalog
