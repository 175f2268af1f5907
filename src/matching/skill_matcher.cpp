#include "fitscore/matching/skill_matcher.h"

#include "fitscore/core/normalization.h"
#include "fitscore/matching/skill_synonyms.h"

#include <algorithm>
#include <iterator>
#include <set>

namespace fitscore::matching {

SkillOverlap skill_overlap(const std::vector<std::string>& candidate_skills,
                           const std::vector<std::string>& job_skills) {
  const auto candidate = core::normalize_skill_list(candidate_skills);
  const auto job = core::normalize_skill_list(job_skills);

  SkillOverlap overlap;
  overlap.required = job.size();

  const std::set<std::string> candidate_set(candidate.begin(), candidate.end());
  std::vector<std::string> exact;
  for (const auto& skill : job) {
    if (candidate_set.count(skill) > 0) {
      exact.push_back(skill);
      overlap.matched.push_back(skill);
    } else {
      overlap.missing.push_back(skill);
    }
  }
  overlap.exact = exact.size();

  const auto expanded_candidate = expand_skills(candidate);
  const auto expanded_job = expand_skills(job);
  const auto expanded_exact = expand_skills(exact);

  std::vector<std::string> expanded_common;
  std::set_intersection(expanded_candidate.begin(), expanded_candidate.end(),
                        expanded_job.begin(), expanded_job.end(),
                        std::back_inserter(expanded_common));

  overlap.synonym = static_cast<std::size_t>(
      std::count_if(expanded_common.begin(), expanded_common.end(),
                    [&](const std::string& token) { return expanded_exact.count(token) == 0; }));

  for (const auto& skill : overlap.missing) {
    const auto group = expand_skills({skill});
    const bool related = std::any_of(group.begin(), group.end(), [&](const std::string& token) {
      return expanded_candidate.count(token) > 0;
    });
    if (related) {
      overlap.related.push_back(skill);
    }
  }
  overlap.synonym_skills = overlap.related.size();

  return overlap;
}

double skill_score(const std::vector<std::string>& candidate_skills,
                   const std::vector<std::string>& job_skills) {
  const auto overlap = skill_overlap(candidate_skills, job_skills);

  if (overlap.required == 0) {
    const bool has_skills = !core::normalize_skill_list(candidate_skills).empty();
    return has_skills ? kNoRequirementPartialCredit : 0.0;
  }

  const auto required = static_cast<double>(overlap.required);
  const double synonym_credit =
      std::min(kSynonymMatchWeight * static_cast<double>(overlap.synonym),
               static_cast<double>(overlap.synonym_skills));
  return std::min(1.0, (static_cast<double>(overlap.exact) + synonym_credit) / required);
}

}  // namespace fitscore::matching
