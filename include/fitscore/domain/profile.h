#pragma once

#include "fitscore/core/result.h"
#include "fitscore/vector/embedding_cache.h"

#include <string>
#include <vector>

namespace fitscore::domain {

// Profile is the unified matching shape of a candidate or a job posting.
// For a job, the fields state requirements: technical_skills are the required skills,
// experience_years the required years, education_text the required education.
//
// Every field is always present; absence is an empty collection, empty string or zero,
// never an error. Skill lists keep their display order; matching treats them as sets.
struct Profile {
  std::string id;                             // Ranking/display key
  std::string title;                          // Job title or candidate headline (display only)
  std::string text;                           // Source text embedded when embedding is empty
  std::vector<std::string> technical_skills;  // Normalized: lowercase, trimmed, unique
  std::vector<std::string> soft_skills;       // Normalized: lowercase, trimmed, unique
  double experience_years{0.0};               // Non-negative
  std::string education_text;                 // Free text; may hold several entries
  vector::Vector embedding;                   // Empty = absent

  // validate checks the invariants of a profile supplied by an external collaborator.
  // Returns ok(true) if valid, err(message) if invalid.
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// normalize_profile produces a normalized copy:
// - skills normalized with core::normalize_skill_list (order preserved, duplicates collapsed)
// - negative or non-finite experience_years replaced by 0
// - id, title and education_text trimmed
// Idempotent.
[[nodiscard]] Profile normalize_profile(const Profile& profile);

}  // namespace fitscore::domain
