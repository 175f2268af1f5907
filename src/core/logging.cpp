#include "fitscore/core/logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string>

namespace fitscore::core {

namespace {

constexpr const char* kLoggerName = "fitscore";

// Diagnostics go to stderr so that stdout stays reserved for JSON results.
void install_stderr_logger() {
  if (spdlog::get(kLoggerName) != nullptr) {
    return;
  }
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  spdlog::set_default_logger(logger);
}

}  // namespace

bool configure_logging(const std::string_view level) {
  install_stderr_logger();
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  const std::string name(level);
  const auto parsed = spdlog::level::from_str(name);

  // from_str maps every unknown name to off; only accept off when it was asked for.
  if (parsed == spdlog::level::off && name != "off") {
    spdlog::set_level(spdlog::level::info);
    return false;
  }

  spdlog::set_level(parsed);
  return true;
}

}  // namespace fitscore::core
