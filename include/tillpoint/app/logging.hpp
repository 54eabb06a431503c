#pragma once

#include <string>

namespace tillpoint::app {

/// Sets pattern and level of the default spdlog logger. Unknown level names fall back to info.
void init_logging(const std::string& level);

}  // namespace tillpoint::app
