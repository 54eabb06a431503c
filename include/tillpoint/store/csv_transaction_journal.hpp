#pragma once

#include <tillpoint/store/transaction_store.hpp>
#include <filesystem>
#include <mutex>

namespace tillpoint::store {

/// Append-only CSV journal: one row per transaction line, header row on first write.
/// Columns: transaction_id,timestamp,payment_method,received,change,reference,
/// subtotal,tax,total,product_id,name,category,unit_price,quantity,line_subtotal.
/// Thread-safe within one process; nothing coordinates two processes.
class CsvTransactionJournal : public ITransactionStore {
 public:
  explicit CsvTransactionJournal(std::filesystem::path path);

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  [[nodiscard]] std::expected<core::Transaction, core::PosError>
  create_transaction(const core::Transaction& record) override;

  [[nodiscard]] std::expected<std::vector<core::Transaction>, core::PosError>
  list_transactions() const override;

  /// Rewrites the file without the matching rows.
  [[nodiscard]] std::expected<void, core::PosError>
  delete_transaction(const std::string& id) override;

 private:
  std::filesystem::path path_;
  mutable std::mutex mutex_;
};

}  // namespace tillpoint::store
