#pragma once

#include "fitscore/matching/scorer.h"

namespace fitscore::matching {

// Production blend: embedding similarity first, then technical skills.
inline ScoreWeights default_preset() {
  return ScoreWeights{0.5, 0.3, 0.15, 0.05, 0.0};
}

}  // namespace fitscore::matching
