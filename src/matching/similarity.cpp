#include "fitscore/matching/similarity.h"

#include "fitscore/embedding/placeholder.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace fitscore::matching {

namespace {

bool all_finite(const vector::Vector& v) {
  return std::all_of(v.begin(), v.end(), [](const float x) { return std::isfinite(x); });
}

double l2_norm(const vector::Vector& v) {
  double sum = 0.0;
  for (const float x : v) {
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  return std::sqrt(sum);
}

SimilarityResult fallback() {
  return SimilarityResult{kFallbackSimilarity, true};
}

}  // namespace

double cosine_similarity(const vector::Vector& a, const vector::Vector& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  double dot_product = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (size_t i = 0; i < a.size(); ++i) {
    const auto x = static_cast<double>(a[i]);
    const auto y = static_cast<double>(b[i]);
    dot_product += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }

  norm_a = std::sqrt(norm_a);
  norm_b = std::sqrt(norm_b);

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  return dot_product / (norm_a * norm_b);
}

SimilarityResult similarity(const vector::Vector& a, const vector::Vector& b) {
  if (a.empty() || b.empty()) {
    spdlog::debug("similarity: embedding absent, using fallback {}", kFallbackSimilarity);
    return fallback();
  }

  // Placeholders were already reported by the provider that produced them.
  if (embedding::is_placeholder_embedding(a) || embedding::is_placeholder_embedding(b)) {
    spdlog::debug("similarity: placeholder embedding, using fallback {}", kFallbackSimilarity);
    return fallback();
  }

  if (a.size() != b.size()) {
    spdlog::warn("similarity: dimension mismatch ({} vs {}), using fallback {}", a.size(),
                 b.size(), kFallbackSimilarity);
    return fallback();
  }

  if (!all_finite(a) || !all_finite(b)) {
    spdlog::warn("similarity: non-finite embedding component, using fallback {}",
                 kFallbackSimilarity);
    return fallback();
  }

  if (l2_norm(a) == 0.0 || l2_norm(b) == 0.0) {
    spdlog::warn("similarity: zero-norm embedding, using fallback {}", kFallbackSimilarity);
    return fallback();
  }

  const double cosine = cosine_similarity(a, b);
  return SimilarityResult{std::clamp(cosine, 0.0, 1.0), false};
}

}  // namespace fitscore::matching
