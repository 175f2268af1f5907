#pragma once

#include "fitscore/config/engine_config.h"
#include "fitscore/core/result.h"
#include "fitscore/domain/profile.h"

#include <optional>
#include <string>
#include <vector>

// read_text_file returns the whole file, or an error naming the path.
fitscore::core::Result<std::string, std::string> read_text_file(const std::string& path);

// load_cli_config loads --config (defaults when absent) and applies its log_level.
// Errors are printed to stderr; returns nullopt on failure.
std::optional<fitscore::config::EngineConfig> load_cli_config(
    const std::optional<std::string>& config_path);

// load_profile_file / load_profiles_file print errors to stderr and return nullopt.
std::optional<fitscore::domain::Profile> load_profile_file(const std::string& path);
std::optional<std::vector<fitscore::domain::Profile>> load_profiles_file(const std::string& path);
