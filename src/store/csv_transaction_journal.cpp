#include <tillpoint/store/csv_transaction_journal.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/text.hpp>
#include "csv_utils.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace tillpoint::store {

namespace {

namespace fs = std::filesystem;

constexpr const char* kHeader =
    "transaction_id,timestamp,payment_method,received,change,reference,"
    "subtotal,tax,total,product_id,name,category,unit_price,quantity,line_subtotal";
constexpr std::size_t kColumns = 15;

std::string format_row(const core::Transaction& t, const core::TransactionLine& l) {
  std::ostringstream oss;
  oss << csv_escape(t.id) << ',' << csv_escape(t.timestamp) << ','
      << core::to_string(t.payment_method) << ',' << core::format_amount(t.received_amount)
      << ',' << core::format_amount(t.change) << ','
      << csv_escape(t.reference_number.value_or("")) << ','
      << core::format_amount(t.subtotal) << ',' << core::format_amount(t.tax) << ','
      << core::format_amount(t.total) << ',' << csv_escape(l.product_id) << ','
      << csv_escape(l.name) << ',' << csv_escape(l.category) << ','
      << core::format_amount(l.unit_price) << ',' << l.quantity << ','
      << core::format_amount(l.subtotal);
  return oss.str();
}

core::Cents amount_or_zero(const std::string& s) {
  return core::parse_amount(s).value_or(0);
}

bool read_records(const fs::path& path, std::vector<std::string>& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::string record;
  while (read_csv_record(in, record)) {
    if (!core::trim_view(record).empty()) out.push_back(record);
  }
  return true;
}

/// Drops whatever a failed append left behind so the journal ends on a complete record.
void roll_back_append(const fs::path& path, bool existed, std::uintmax_t size) {
  std::error_code ec;
  if (existed) {
    fs::resize_file(path, size, ec);
  } else {
    fs::remove(path, ec);
  }
  if (ec) {
    spdlog::error("[journal] could not roll back {}: {}", path.string(), ec.message());
  }
}

}  // namespace

CsvTransactionJournal::CsvTransactionJournal(std::filesystem::path path)
    : path_(std::move(path)) {}

std::expected<core::Transaction, core::PosError>
CsvTransactionJournal::create_transaction(const core::Transaction& record) {
  std::lock_guard lock(mutex_);

  std::error_code ec;
  const bool exists = fs::exists(path_, ec);
  std::uintmax_t prior_size = 0;
  if (exists) {
    prior_size = fs::file_size(path_, ec);
    if (ec) {
      spdlog::error("[journal] cannot stat {}: {}", path_.string(), ec.message());
      return std::unexpected(core::PosError::StoreUnavailable);
    }
  } else if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
  }

  std::string block;
  if (!exists) {
    block += kHeader;
    block += '\n';
  }
  for (const auto& line : record.items) {
    block += format_row(record, line);
    block += '\n';
  }

  std::ofstream out(path_, std::ios::app | std::ios::binary);
  if (!out) {
    spdlog::error("[journal] cannot open {} for append", path_.string());
    return std::unexpected(core::PosError::StoreUnavailable);
  }
  out.write(block.data(), static_cast<std::streamsize>(block.size()));
  out.flush();
  const bool written = static_cast<bool>(out);
  out.close();
  if (!written || !out) {
    spdlog::error("[journal] write to {} failed for {}", path_.string(), record.id);
    roll_back_append(path_, exists, prior_size);
    return std::unexpected(core::PosError::StoreUnavailable);
  }
  return record;
}

std::expected<std::vector<core::Transaction>, core::PosError>
CsvTransactionJournal::list_transactions() const {
  std::lock_guard lock(mutex_);

  std::vector<core::Transaction> out;
  std::error_code ec;
  if (!fs::exists(path_, ec)) return out;

  std::vector<std::string> lines;
  if (!read_records(path_, lines)) return std::unexpected(core::PosError::StoreUnavailable);

  for (std::size_t i = 1; i < lines.size(); ++i) {
    const auto cols = split_csv_line(lines[i]);
    if (cols.size() < kColumns) continue;

    if (out.empty() || out.back().id != cols[0]) {
      core::Transaction t;
      t.id = cols[0];
      t.timestamp = cols[1];
      t.payment_method = core::parse_payment_method(cols[2]).value_or(core::PaymentMethod::Cash);
      t.received_amount = amount_or_zero(cols[3]);
      t.change = amount_or_zero(cols[4]);
      if (!cols[5].empty()) t.reference_number = cols[5];
      t.subtotal = amount_or_zero(cols[6]);
      t.tax = amount_or_zero(cols[7]);
      t.total = amount_or_zero(cols[8]);
      out.push_back(std::move(t));
    }

    core::TransactionLine line;
    line.product_id = cols[9];
    line.name = cols[10];
    line.category = cols[11];
    line.unit_price = amount_or_zero(cols[12]);
    const auto* qty_end = cols[13].data() + cols[13].size();
    if (std::from_chars(cols[13].data(), qty_end, line.quantity).ec != std::errc{}) {
      line.quantity = 0;
    }
    line.subtotal = amount_or_zero(cols[14]);
    out.back().items.push_back(std::move(line));
  }
  return out;
}

std::expected<void, core::PosError>
CsvTransactionJournal::delete_transaction(const std::string& id) {
  std::lock_guard lock(mutex_);

  std::vector<std::string> lines;
  if (!read_records(path_, lines)) return std::unexpected(core::PosError::TransactionNotFound);

  std::vector<std::string> kept;
  kept.reserve(lines.size());
  bool removed = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      const auto cols = split_csv_line(lines[i]);
      if (!cols.empty() && cols[0] == id) {
        removed = true;
        continue;
      }
    }
    kept.push_back(lines[i]);
  }
  if (!removed) return std::unexpected(core::PosError::TransactionNotFound);

  std::ofstream out(path_, std::ios::trunc | std::ios::binary);
  if (!out) return std::unexpected(core::PosError::StoreUnavailable);
  for (const auto& l : kept) out << l << '\n';
  if (!out) return std::unexpected(core::PosError::StoreUnavailable);
  return {};
}

}  // namespace tillpoint::store
