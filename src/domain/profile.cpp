#include "fitscore/domain/profile.h"

#include "fitscore/core/normalization.h"

#include <cmath>

namespace fitscore::domain {

core::Result<bool, std::string> Profile::validate() const {
  if (!std::isfinite(experience_years)) {
    return core::Result<bool, std::string>::err("experience_years must be finite");
  }

  if (experience_years < 0.0) {
    return core::Result<bool, std::string>::err("experience_years must not be negative");
  }

  for (const float value : embedding) {
    if (!std::isfinite(value)) {
      return core::Result<bool, std::string>::err("embedding must contain only finite values");
    }
  }

  if (core::normalize_skill_list(technical_skills) != technical_skills) {
    return core::Result<bool, std::string>::err(
        "technical_skills must be normalized (lowercase, trimmed, deduplicated)");
  }

  if (core::normalize_skill_list(soft_skills) != soft_skills) {
    return core::Result<bool, std::string>::err(
        "soft_skills must be normalized (lowercase, trimmed, deduplicated)");
  }

  return core::Result<bool, std::string>::ok(true);
}

Profile normalize_profile(const Profile& profile) {
  Profile normalized = profile;

  normalized.id = core::trim(profile.id);
  normalized.title = core::trim(profile.title);
  normalized.education_text = core::trim(profile.education_text);
  normalized.technical_skills = core::normalize_skill_list(profile.technical_skills);
  normalized.soft_skills = core::normalize_skill_list(profile.soft_skills);

  if (!std::isfinite(profile.experience_years) || profile.experience_years < 0.0) {
    normalized.experience_years = 0.0;
  }

  return normalized;
}

}  // namespace fitscore::domain
