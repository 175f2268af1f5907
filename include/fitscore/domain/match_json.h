#pragma once

#include "fitscore/core/result.h"
#include "fitscore/domain/match_result.h"
#include "fitscore/domain/profile.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace fitscore::domain {

// profile_from_json reads a profile object. Every key is optional:
//   id, title, text, technical_skills, soft_skills, experience_years,
//   education (string, or array of strings joined with "; "), embedding.
// Throws nlohmann::json::exception on type mismatches.
[[nodiscard]] Profile profile_from_json(const nlohmann::json& j);

// parse_profile / parse_profiles wrap profile_from_json for raw JSON text.
// parse_profiles accepts an array of objects or a single object.
[[nodiscard]] core::Result<Profile, std::string> parse_profile(const std::string& json_str);
[[nodiscard]] core::Result<std::vector<Profile>, std::string> parse_profiles(
    const std::string& json_str);

[[nodiscard]] nlohmann::json to_json(const SubScoreSet& scores);
[[nodiscard]] nlohmann::json to_json(const MatchExplanation& explanation);
[[nodiscard]] nlohmann::json to_json(const MatchResult& result);
[[nodiscard]] nlohmann::json to_json(const BatchMatchReport& report);

}  // namespace fitscore::domain
