#pragma once

#include <string_view>

namespace fitscore::core {

// configure_logging routes the default spdlog logger to stderr and sets its level.
// Accepts trace|debug|info|warn|error|critical|off. Unknown names select info
// and return false so the caller can report the bad value.
bool configure_logging(std::string_view level);

}  // namespace fitscore::core
