#pragma once

#include <tillpoint/core/error.hpp>
#include <tillpoint/core/transaction.hpp>
#include <expected>
#include <string>
#include <vector>

namespace tillpoint::store {

/// Persistent transaction log. create_transaction is not idempotent:
/// calling it twice with the same record stores it twice.
class ITransactionStore {
 public:
  virtual ~ITransactionStore() = default;

  [[nodiscard]] virtual std::expected<core::Transaction, core::PosError>
  create_transaction(const core::Transaction& record) = 0;

  [[nodiscard]] virtual std::expected<std::vector<core::Transaction>, core::PosError>
  list_transactions() const = 0;

  /// Removes every record with this id; TransactionNotFound if there is none.
  [[nodiscard]] virtual std::expected<void, core::PosError>
  delete_transaction(const std::string& id) = 0;
};

}  // namespace tillpoint::store
