#pragma once

#include <tillpoint/store/catalog_store.hpp>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace tillpoint::store {

/// Thread-safe catalog held in memory, in insertion order (tests, CLI replay).
/// Failure switches simulate an unreachable or partially failing remote store.
class InMemoryCatalogStore : public ICatalogStore {
 public:
  InMemoryCatalogStore() = default;
  explicit InMemoryCatalogStore(std::vector<core::Product> products);

  /// Inserts or replaces the product with the same id.
  void upsert(core::Product product);

  /// When set, every call fails with StoreUnavailable.
  void set_unavailable(bool unavailable);

  /// update_product fails with StoreUnavailable for this product id.
  void fail_updates_for(const std::string& product_id);
  void clear_failures();

  [[nodiscard]] std::size_t update_count() const;

  [[nodiscard]] std::expected<std::vector<core::Product>, core::PosError>
  list_products() const override;

  [[nodiscard]] std::expected<core::Product, core::PosError>
  get_product(const std::string& id) const override;

  [[nodiscard]] std::expected<core::Product, core::PosError>
  update_product(const std::string& id, const core::ProductPatch& patch) override;

 private:
  mutable std::mutex mutex_;
  std::vector<core::Product> products_;
  std::set<std::string> failing_updates_;
  bool unavailable_{false};
  std::size_t update_count_{0};
};

}  // namespace tillpoint::store
