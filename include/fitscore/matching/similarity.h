#pragma once

#include "fitscore/vector/embedding_cache.h"

namespace fitscore::matching {

// Neutral similarity reported when two vectors cannot be compared
// ("unknown similarity, assume moderate"). Kept stable for reproducibility of scores.
constexpr double kFallbackSimilarity = 0.75;

struct SimilarityResult {
  double value{kFallbackSimilarity};  // In [0,1]
  bool fallback{true};                // True when value is kFallbackSimilarity by policy
};

// cosine_similarity returns cos(a, b) in [-1, 1].
// Returns 0.0 for empty, mismatched or zero-norm inputs.
[[nodiscard]] double cosine_similarity(const vector::Vector& a, const vector::Vector& b);

// similarity compares two embeddings and never throws.
// Falls back to kFallbackSimilarity when either vector is empty, a placeholder,
// non-finite or zero-norm, or when the dimensions differ. Otherwise the cosine is
// clamped to [0,1].
[[nodiscard]] SimilarityResult similarity(const vector::Vector& a, const vector::Vector& b);

}  // namespace fitscore::matching
