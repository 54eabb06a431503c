#include <tillpoint/app/config.hpp>
#include <tillpoint/core/text.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <string_view>

namespace tillpoint::app {

namespace {

/// Leaves out untouched unless value is a complete number.
template <typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
  T parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    spdlog::warn("[config] ignoring {}={}: not a number", key, value);
    return;
  }
  out = parsed;
}

}  // namespace

TerminalConfig default_config() {
  return TerminalConfig{};
}

TerminalConfig load_config(const std::string& path) {
  TerminalConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("[config] cannot open {}, using defaults", path);
    return c;
  }

  std::string line;
  while (std::getline(f, line)) {
    const auto content = core::trim_view(line);
    if (content.empty() || content.front() == '#') continue;
    const auto entry = core::split_key_value(content);
    if (!entry) {
      spdlog::debug("[config] skipping line without '=': {}", content);
      continue;
    }
    const auto& [key, value] = *entry;

    if (key == "scan_inactivity_ms") parse_number(key, value, c.scan_inactivity_ms);
    else if (key == "form_scan_inactivity_ms") parse_number(key, value, c.form_scan_inactivity_ms);
    else if (key == "min_token_length") parse_number(key, value, c.min_token_length);
    else if (key == "form_min_token_length") parse_number(key, value, c.form_min_token_length);
    else if (key == "dedup_sale_ms") parse_number(key, value, c.dedup_sale_ms);
    else if (key == "dedup_default_ms") parse_number(key, value, c.dedup_default_ms);
    else if (key == "processing_hold_ms") parse_number(key, value, c.processing_hold_ms);
    else if (key == "handoff_grace_ms") parse_number(key, value, c.handoff_grace_ms);
    else if (key == "cache_min_refresh_interval_ms") parse_number(key, value, c.cache_min_refresh_interval_ms);
    else if (key == "cache_refresh_period_ms") parse_number(key, value, c.cache_refresh_period_ms);
    else if (key == "tax_rate_bp") parse_number(key, value, c.tax_rate_bp);
    else if (key == "log_level") c.log_level = value;
    else if (key == "transaction_journal_path") c.transaction_journal_path = value;
    else spdlog::debug("[config] unknown key {}", key);
  }
  return c;
}

}  // namespace tillpoint::app
