#include "engine_setup.h"

#include "fitscore/core/logging.h"
#include "fitscore/domain/match_json.h"

#include <fstream>
#include <iostream>
#include <sstream>

fitscore::core::Result<std::string, std::string> read_text_file(const std::string& path) {
  using FileResult = fitscore::core::Result<std::string, std::string>;
  std::ifstream in(path);
  if (!in) {
    return FileResult::err("cannot open file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return FileResult::ok(buffer.str());
}

std::optional<fitscore::config::EngineConfig> load_cli_config(
    const std::optional<std::string>& config_path) {
  fitscore::config::EngineConfig config;
  if (config_path.has_value()) {
    auto result = fitscore::config::load_engine_config(*config_path);
    if (!result.has_value()) {
      std::cerr << "Error: " << result.error() << "\n";
      return std::nullopt;
    }
    config = result.value();
  }

  if (!fitscore::core::configure_logging(config.log_level)) {
    std::cerr << "Warning: unknown log_level '" << config.log_level << "', using info\n";
  }
  return config;
}

std::optional<fitscore::domain::Profile> load_profile_file(const std::string& path) {
  const auto text = read_text_file(path);
  if (!text.has_value()) {
    std::cerr << "Error: " << text.error() << "\n";
    return std::nullopt;
  }
  auto profile = fitscore::domain::parse_profile(text.value());
  if (!profile.has_value()) {
    std::cerr << "Error: " << path << ": " << profile.error() << "\n";
    return std::nullopt;
  }
  return profile.value();
}

std::optional<std::vector<fitscore::domain::Profile>> load_profiles_file(const std::string& path) {
  const auto text = read_text_file(path);
  if (!text.has_value()) {
    std::cerr << "Error: " << text.error() << "\n";
    return std::nullopt;
  }
  auto profiles = fitscore::domain::parse_profiles(text.value());
  if (!profiles.has_value()) {
    std::cerr << "Error: " << path << ": " << profiles.error() << "\n";
    return std::nullopt;
  }
  return profiles.value();
}
