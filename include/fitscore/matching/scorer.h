#pragma once

namespace fitscore::matching {

// ScoreWeights controls how much each component contributes to the overall score.
// Weights need not sum to 1: combine_scores renormalizes by the actual sum.
struct ScoreWeights {
  double similarity{0.5};
  double technical{0.3};
  double experience{0.15};
  double education{0.05};
  double soft_skills{0.0};

  [[nodiscard]] double sum() const {
    return similarity + technical + experience + education + soft_skills;
  }
};

}  // namespace fitscore::matching
