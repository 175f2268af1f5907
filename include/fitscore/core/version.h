#pragma once

namespace fitscore::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace fitscore::core
