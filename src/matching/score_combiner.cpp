#include "fitscore/matching/score_combiner.h"

#include <algorithm>
#include <cmath>

namespace fitscore::matching {

namespace {

double clamp_unit(const double value) {
  if (!std::isfinite(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

// Negative or non-finite weights contribute nothing.
double sanitize_weight(const double weight) {
  if (!std::isfinite(weight) || weight < 0.0) {
    return 0.0;
  }
  return weight;
}

}  // namespace

double combine_scores(const double similarity, const domain::SubScoreSet& scores,
                      const ScoreWeights& weights) {
  const ScoreWeights w{sanitize_weight(weights.similarity), sanitize_weight(weights.technical),
                       sanitize_weight(weights.experience), sanitize_weight(weights.education),
                       sanitize_weight(weights.soft_skills)};

  const double weighted = w.similarity * clamp_unit(similarity) +
                          w.technical * clamp_unit(scores.technical_skills) +
                          w.experience * clamp_unit(scores.experience) +
                          w.education * clamp_unit(scores.education) +
                          w.soft_skills * clamp_unit(scores.soft_skills);

  const double total = w.sum();
  const double denominator = total > 0.0 ? total : 1.0;

  const double overall = std::clamp(weighted / denominator, 0.0, 1.0) * 100.0;
  return std::round(overall * 100.0) / 100.0;
}

}  // namespace fitscore::matching
