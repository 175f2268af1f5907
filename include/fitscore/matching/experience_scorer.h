#pragma once

namespace fitscore::matching {

// Full credit when the job states no experience requirement. Differs on purpose from the
// partial credit of the skill and soft-skill scorers.
constexpr double kExperienceNoRequirementScore = 1.0;

// experience_score returns min(candidate / required, 1) when required > 0,
// else kExperienceNoRequirementScore.
// Negative or non-finite inputs are treated as 0 years.
[[nodiscard]] double experience_score(double candidate_years, double required_years);

}  // namespace fitscore::matching
