#pragma once

#include <string>
#include <vector>

namespace fitscore::matching {

// Partial credit when the job lists no soft skills but the candidate has some.
constexpr double kSoftSkillNoRequirementPartialCredit = 0.3;

// soft_skill_score returns |candidate ∩ required| / |required| over normalized sets.
// Required empty: kSoftSkillNoRequirementPartialCredit if the candidate has any, else 0.0.
[[nodiscard]] double soft_skill_score(const std::vector<std::string>& candidate_soft_skills,
                                      const std::vector<std::string>& required_soft_skills);

}  // namespace fitscore::matching
