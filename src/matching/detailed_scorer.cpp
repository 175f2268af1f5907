#include "fitscore/matching/detailed_scorer.h"

#include "fitscore/matching/education_scorer.h"
#include "fitscore/matching/experience_scorer.h"
#include "fitscore/matching/skill_matcher.h"
#include "fitscore/matching/soft_skill_scorer.h"

namespace fitscore::matching {

domain::SubScoreSet detailed_scores(const domain::Profile& candidate, const domain::Profile& job) {
  domain::SubScoreSet scores;
  scores.technical_skills = skill_score(candidate.technical_skills, job.technical_skills);
  scores.experience = experience_score(candidate.experience_years, job.experience_years);
  scores.education = education_score(candidate.education_text, job.education_text);
  scores.soft_skills = soft_skill_score(candidate.soft_skills, job.soft_skills);
  return scores;
}

}  // namespace fitscore::matching
