#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace fitscore::matching {

// Partial credit when the job lists no technical skills but the candidate has some.
constexpr double kNoRequirementPartialCredit = 0.5;

// Weight applied to expanded-only tokens. Every synonym group has at least two members,
// so a job skill matched only through a synonym yields two or more such tokens and
// 0.7 x tokens always reaches the one-credit cap below: with the built-in table a
// synonym-only match earns the same full credit as an exact match.
constexpr double kSynonymMatchWeight = 0.7;

// SkillOverlap is the breakdown behind a skill score.
struct SkillOverlap {
  std::size_t required{0};        // Normalized job skills (denominator)
  std::size_t exact{0};           // Job skills the candidate lists verbatim
  std::size_t synonym{0};         // Expanded-only tokens, see skill_overlap()
  std::size_t synonym_skills{0};  // Job skills matched only through a synonym group
  std::vector<std::string> matched;  // Exact matches, in job order
  std::vector<std::string> related;  // Synonym-only matches, in job order
  std::vector<std::string> missing;  // Job skills without an exact match, in job order
};

// skill_overlap normalizes both lists and computes:
//   exact   = candidate ∩ job
//   synonym = |expand(candidate) ∩ expand(job)| minus the tokens of expand(exact)
// Tokens pulled in by an exact match's own aliases never count as synonym matches.
// synonym_skills counts the non-exact job skills whose expansion meets expand(candidate).
[[nodiscard]] SkillOverlap skill_overlap(const std::vector<std::string>& candidate_skills,
                                         const std::vector<std::string>& job_skills);

// skill_score returns a value in [0,1]:
// - job empty: kNoRequirementPartialCredit if the candidate has any skill, else 0.0
// - otherwise min(1, (exact + min(kSynonymMatchWeight * synonym, synonym_skills)) / required)
// The synonym term is capped at one credit per job skill it actually matched. The
// weight only bounds credit in principle; in practice the cap binds, so
// skill_score({"reactjs"}, {"react"}) == 1.0 and a synonym match equals an exact one.
[[nodiscard]] double skill_score(const std::vector<std::string>& candidate_skills,
                                 const std::vector<std::string>& job_skills);

}  // namespace fitscore::matching
