#include <tillpoint/store/in_memory_transaction_store.hpp>
#include <algorithm>

namespace tillpoint::store {

void InMemoryTransactionStore::set_fail_writes(bool fail) {
  std::lock_guard lock(mutex_);
  fail_writes_ = fail;
}

std::expected<core::Transaction, core::PosError>
InMemoryTransactionStore::create_transaction(const core::Transaction& record) {
  std::lock_guard lock(mutex_);
  if (fail_writes_) return std::unexpected(core::PosError::StoreUnavailable);
  records_.push_back(record);
  return record;
}

std::expected<std::vector<core::Transaction>, core::PosError>
InMemoryTransactionStore::list_transactions() const {
  std::lock_guard lock(mutex_);
  return records_;
}

std::expected<void, core::PosError>
InMemoryTransactionStore::delete_transaction(const std::string& id) {
  std::lock_guard lock(mutex_);
  const auto removed = std::erase_if(
      records_, [&](const core::Transaction& t) { return t.id == id; });
  if (removed == 0) return std::unexpected(core::PosError::TransactionNotFound);
  return {};
}

}  // namespace tillpoint::store
