#include <tillpoint/store/in_memory_catalog_store.hpp>
#include <algorithm>

namespace tillpoint::store {

InMemoryCatalogStore::InMemoryCatalogStore(std::vector<core::Product> products) {
  for (auto& p : products) {
    upsert(std::move(p));
  }
}

void InMemoryCatalogStore::upsert(core::Product product) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(products_.begin(), products_.end(),
                         [&](const core::Product& p) { return p.id == product.id; });
  if (it != products_.end()) {
    *it = std::move(product);
  } else {
    products_.push_back(std::move(product));
  }
}

void InMemoryCatalogStore::set_unavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

void InMemoryCatalogStore::fail_updates_for(const std::string& product_id) {
  std::lock_guard lock(mutex_);
  failing_updates_.insert(product_id);
}

void InMemoryCatalogStore::clear_failures() {
  std::lock_guard lock(mutex_);
  failing_updates_.clear();
  unavailable_ = false;
}

std::size_t InMemoryCatalogStore::update_count() const {
  std::lock_guard lock(mutex_);
  return update_count_;
}

std::expected<std::vector<core::Product>, core::PosError>
InMemoryCatalogStore::list_products() const {
  std::lock_guard lock(mutex_);
  if (unavailable_) return std::unexpected(core::PosError::StoreUnavailable);
  return products_;
}

std::expected<core::Product, core::PosError>
InMemoryCatalogStore::get_product(const std::string& id) const {
  std::lock_guard lock(mutex_);
  if (unavailable_) return std::unexpected(core::PosError::StoreUnavailable);
  for (const auto& p : products_) {
    if (p.id == id) return p;
  }
  return std::unexpected(core::PosError::ProductNotFound);
}

std::expected<core::Product, core::PosError>
InMemoryCatalogStore::update_product(const std::string& id,
                                     const core::ProductPatch& patch) {
  std::lock_guard lock(mutex_);
  if (unavailable_ || failing_updates_.contains(id)) {
    return std::unexpected(core::PosError::StoreUnavailable);
  }
  for (auto& p : products_) {
    if (p.id == id) {
      core::apply_patch(p, patch);
      ++update_count_;
      return p;
    }
  }
  return std::unexpected(core::PosError::ProductNotFound);
}

}  // namespace tillpoint::store
