#include "fitscore/domain/match_json.h"

namespace fitscore::domain {

namespace {

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return {};
  }
  return j[key].get<std::vector<std::string>>();
}

// Extraction components emit education either as one string or as one line per entry.
std::string education_text(const nlohmann::json& j) {
  if (!j.contains("education") || j["education"].is_null()) {
    return {};
  }
  const auto& value = j["education"];
  if (value.is_string()) {
    return value.get<std::string>();
  }

  std::string joined;
  for (const auto& entry : value) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += entry.get<std::string>();
  }
  return joined;
}

}  // namespace

Profile profile_from_json(const nlohmann::json& j) {
  Profile profile;

  profile.id = j.value("id", "");
  profile.title = j.value("title", "");
  profile.text = j.value("text", "");
  profile.technical_skills = string_list(j, "technical_skills");
  profile.soft_skills = string_list(j, "soft_skills");
  profile.experience_years = j.value("experience_years", 0.0);
  profile.education_text = education_text(j);

  if (j.contains("embedding") && !j["embedding"].is_null()) {
    profile.embedding = j["embedding"].get<vector::Vector>();
  }

  return profile;
}

core::Result<Profile, std::string> parse_profile(const std::string& json_str) {
  try {
    const auto j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      return core::Result<Profile, std::string>::err("profile must be a JSON object");
    }
    return core::Result<Profile, std::string>::ok(profile_from_json(j));
  } catch (const nlohmann::json::exception& e) {
    return core::Result<Profile, std::string>::err(std::string("invalid profile JSON: ") +
                                                   e.what());
  }
}

core::Result<std::vector<Profile>, std::string> parse_profiles(const std::string& json_str) {
  using ProfilesResult = core::Result<std::vector<Profile>, std::string>;
  try {
    const auto j = nlohmann::json::parse(json_str);
    std::vector<Profile> profiles;
    if (j.is_object()) {
      profiles.push_back(profile_from_json(j));
    } else if (j.is_array()) {
      for (const auto& entry : j) {
        if (!entry.is_object()) {
          return ProfilesResult::err("every profile must be a JSON object");
        }
        profiles.push_back(profile_from_json(entry));
      }
    } else {
      return ProfilesResult::err("profiles must be a JSON object or array");
    }
    return ProfilesResult::ok(std::move(profiles));
  } catch (const nlohmann::json::exception& e) {
    return ProfilesResult::err(std::string("invalid profiles JSON: ") + e.what());
  }
}

nlohmann::json to_json(const SubScoreSet& scores) {
  nlohmann::json j;
  for (const auto kind : kAllSubScores) {
    j[std::string(sub_score_name(kind))] = scores.get(kind);
  }
  return j;
}

nlohmann::json to_json(const MatchExplanation& explanation) {
  nlohmann::json j;
  j["strengths"] = explanation.strengths;
  j["gaps"] = explanation.gaps;
  j["recommendations"] = explanation.recommendations;
  j["interview_questions"] = explanation.interview_questions;
  j["narrative"] = explanation.narrative;
  j["coarse_overall"] = explanation.coarse_overall;
  j["tier"] = std::string(tier_name(explanation.tier));
  return j;
}

nlohmann::json to_json(const MatchResult& result) {
  nlohmann::json j;
  j["candidate_id"] = result.candidate_id;
  j["job_id"] = result.job_id;
  j["similarity"] = result.similarity;
  j["similarity_fallback"] = result.similarity_fallback;
  j["sub_scores"] = to_json(result.sub_scores);
  j["overall_score"] = result.overall_score;
  j["explanation"] = to_json(result.explanation);
  return j;
}

nlohmann::json to_json(const BatchMatchReport& report) {
  nlohmann::json j;
  j["job_id"] = report.job_id;
  j["evaluated"] = report.evaluated;

  nlohmann::json ranked = nlohmann::json::array();
  for (const auto& result : report.ranked) {
    ranked.push_back(to_json(result));
  }
  j["ranked"] = ranked;

  nlohmann::json failures = nlohmann::json::array();
  for (const auto& failure : report.failures) {
    failures.push_back({{"candidate_id", failure.candidate_id},
                        {"candidate_index", failure.candidate_index},
                        {"message", failure.message}});
  }
  j["failures"] = failures;

  return j;
}

}  // namespace fitscore::domain
