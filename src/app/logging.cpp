#include <tillpoint/app/logging.hpp>
#include <spdlog/spdlog.h>

namespace tillpoint::app {

void init_logging(const std::string& level) {
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

}  // namespace tillpoint::app
