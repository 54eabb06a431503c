#pragma once

#include <tillpoint/core/money.hpp>
#include <cstdint>
#include <string>

namespace tillpoint::app {

/// Terminal configuration: scanner timing, dedup windows, cache refresh, tax.
/// Durations are in milliseconds.
struct TerminalConfig {
  std::uint32_t scan_inactivity_ms{150};
  std::uint32_t form_scan_inactivity_ms{100};
  std::uint32_t min_token_length{4};
  std::uint32_t form_min_token_length{7};
  std::uint32_t dedup_sale_ms{500};
  std::uint32_t dedup_default_ms{2000};
  std::uint32_t processing_hold_ms{300};
  std::uint32_t handoff_grace_ms{1000};
  std::uint32_t cache_min_refresh_interval_ms{2000};
  std::uint32_t cache_refresh_period_ms{30000};  // 0 disables the periodic refresh
  std::int32_t tax_rate_bp{core::kDefaultTaxRateBp};
  std::string log_level{"info"};
  std::string transaction_journal_path;  // empty = keep transactions in memory
};

/// Load config from a simple key=value file (one per line, # comments) or use defaults.
/// Unknown keys and unparsable values are ignored.
TerminalConfig load_config(const std::string& path);

/// Default config when no file is provided.
TerminalConfig default_config();

}  // namespace tillpoint::app
