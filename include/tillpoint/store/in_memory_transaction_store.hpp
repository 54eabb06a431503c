#pragma once

#include <tillpoint/store/transaction_store.hpp>
#include <mutex>
#include <vector>

namespace tillpoint::store {

/// Thread-safe in-memory transaction log (tests, CLI replay without a journal).
class InMemoryTransactionStore : public ITransactionStore {
 public:
  /// When set, create_transaction fails with StoreUnavailable.
  void set_fail_writes(bool fail);

  [[nodiscard]] std::expected<core::Transaction, core::PosError>
  create_transaction(const core::Transaction& record) override;

  [[nodiscard]] std::expected<std::vector<core::Transaction>, core::PosError>
  list_transactions() const override;

  [[nodiscard]] std::expected<void, core::PosError>
  delete_transaction(const std::string& id) override;

 private:
  mutable std::mutex mutex_;
  std::vector<core::Transaction> records_;
  bool fail_writes_{false};
};

}  // namespace tillpoint::store
