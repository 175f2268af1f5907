#pragma once

#include "fitscore/domain/sub_scores.h"
#include "fitscore/matching/scorer.h"

namespace fitscore::matching {

// combine_scores blends similarity and the four sub-scores into [0,100]:
//   each input clamped to [0,1] (non-finite reads 0),
//   weighted sum / sum of weights (a zero or non-positive sum divides by 1),
//   times 100, rounded to 2 decimal places.
// Non-decreasing in similarity and in every sub-score.
[[nodiscard]] double combine_scores(double similarity, const domain::SubScoreSet& scores,
                                    const ScoreWeights& weights = ScoreWeights{});

}  // namespace fitscore::matching
