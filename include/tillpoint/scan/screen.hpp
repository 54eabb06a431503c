#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace tillpoint::scan {

/// Terminal screens. Sale and Catalog have their own barcode handling;
/// every other screen hands scanned products over to Sale.
enum class Screen : std::uint8_t {
  Sale,
  Catalog,
  Dashboard,
  SalesHistory,
  Reports,
  Settings,
};

[[nodiscard]] std::string_view to_string(Screen s) noexcept;

[[nodiscard]] std::optional<Screen> parse_screen(std::string_view name);

}  // namespace tillpoint::scan
