#include <tillpoint/scan/screen.hpp>
#include <array>
#include <utility>

namespace tillpoint::scan {

namespace {

constexpr std::array<std::pair<Screen, std::string_view>, 6> kNames = {{
    {Screen::Sale, "sale"},
    {Screen::Catalog, "catalog"},
    {Screen::Dashboard, "dashboard"},
    {Screen::SalesHistory, "sales-history"},
    {Screen::Reports, "reports"},
    {Screen::Settings, "settings"},
}};

}  // namespace

std::string_view to_string(Screen s) noexcept {
  for (const auto& [screen, name] : kNames) {
    if (screen == s) return name;
  }
  return "unknown";
}

std::optional<Screen> parse_screen(std::string_view name) {
  for (const auto& [screen, n] : kNames) {
    if (n == name) return screen;
  }
  return std::nullopt;
}

}  // namespace tillpoint::scan
