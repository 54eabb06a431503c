#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/product.hpp>
#include <expected>
#include <string>
#include <vector>

namespace tillpoint::store {

/// Authoritative product catalog (remote in production).
/// Implementations must give a caller read-after-write consistency for its own
/// writes; no isolation between callers is assumed. Must be safe to call from
/// several threads at once (inventory decrements run concurrently).
class ICatalogStore {
 public:
  virtual ~ICatalogStore() = default;

  [[nodiscard]] virtual std::expected<std::vector<core::Product>, core::PosError>
  list_products() const = 0;

  /// ProductNotFound if id is unknown.
  [[nodiscard]] virtual std::expected<core::Product, core::PosError>
  get_product(const std::string& id) const = 0;

  /// Returns the record after the patch was applied.
  [[nodiscard]] virtual std::expected<core::Product, core::PosError>
  update_product(const std::string& id, const core::ProductPatch& patch) = 0;
};

}  // namespace tillpoint::store
