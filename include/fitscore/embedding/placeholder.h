#pragma once

#include "fitscore/vector/embedding_cache.h"

#include <cstddef>

namespace fitscore::embedding {

// Dimensionality of the reference sentence encoder (mpnet-base class models).
constexpr std::size_t kDefaultEmbeddingDimension = 768;

// Every component of a placeholder vector carries this value.
constexpr float kPlaceholderComponent = 0.1f;

// Upper bound on |component| for a constant vector to count as a placeholder.
constexpr float kPlaceholderMaxMagnitude = 1.0f;

// make_placeholder_embedding returns the degraded-mode sentinel: dimension copies of
// kPlaceholderComponent. Returned when the encoder cannot be loaded or fails.
[[nodiscard]] vector::Vector make_placeholder_embedding(
    std::size_t dimension = kDefaultEmbeddingDimension);

// is_placeholder_embedding recognizes the sentinel and any other constant vector of
// low magnitude (every component equal, |value| <= kPlaceholderMaxMagnitude).
// Such vectors carry no semantic content; similarity treats them as absent.
// Empty and single-component vectors are not placeholders.
[[nodiscard]] bool is_placeholder_embedding(const vector::Vector& embedding);

}  // namespace fitscore::embedding
