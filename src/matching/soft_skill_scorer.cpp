#include "fitscore/matching/soft_skill_scorer.h"

#include "fitscore/core/normalization.h"

#include <algorithm>
#include <set>

namespace fitscore::matching {

double soft_skill_score(const std::vector<std::string>& candidate_soft_skills,
                        const std::vector<std::string>& required_soft_skills) {
  const auto candidate = core::normalize_skill_list(candidate_soft_skills);
  const auto required = core::normalize_skill_list(required_soft_skills);

  if (required.empty()) {
    return candidate.empty() ? 0.0 : kSoftSkillNoRequirementPartialCredit;
  }

  const std::set<std::string> candidate_set(candidate.begin(), candidate.end());
  const auto common = std::count_if(required.begin(), required.end(), [&](const std::string& s) {
    return candidate_set.count(s) > 0;
  });

  return static_cast<double>(common) / static_cast<double>(required.size());
}

}  // namespace fitscore::matching
