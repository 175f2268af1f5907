#include "fitscore/matching/experience_scorer.h"

#include <algorithm>
#include <cmath>

namespace fitscore::matching {

namespace {

double sanitize_years(const double years) {
  if (!std::isfinite(years) || years < 0.0) {
    return 0.0;
  }
  return years;
}

}  // namespace

double experience_score(const double candidate_years, const double required_years) {
  const double required = sanitize_years(required_years);
  if (required <= 0.0) {
    return kExperienceNoRequirementScore;
  }
  return std::min(sanitize_years(candidate_years) / required, 1.0);
}

}  // namespace fitscore::matching
