#pragma once

#include "fitscore/domain/match_result.h"
#include "fitscore/domain/profile.h"
#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/matching/scorer.h"

#include <cstddef>
#include <vector>

namespace fitscore::matching {

// BatchOptions controls one-job-versus-many-candidates evaluation.
struct BatchOptions {
  std::size_t max_parallelism{1};  // Worker threads, see batch_worker_count; 0 and 1 mean sequential
  std::size_t top_k{0};            // Keep the best top_k results; 0 keeps all
};

// batch_worker_count is the number of threads evaluate_batch uses: max_parallelism
// bounded by the candidate count and std::thread::hardware_concurrency(), at least 1.
[[nodiscard]] std::size_t batch_worker_count(std::size_t max_parallelism,
                                             std::size_t candidate_count);

// Matcher runs the full pipeline for candidate/job pairs:
// normalize -> resolve embeddings -> similarity -> sub-scores -> combine -> explain.
//
// Weights are fixed at construction. evaluate() and evaluate_batch() are const and share
// no mutable state, so one Matcher may serve concurrent callers as long as the embedding
// provider is thread-safe. The provider is borrowed and must outlive the Matcher.
class Matcher {
 public:
  explicit Matcher(ScoreWeights weights = ScoreWeights{},
                   const embedding::IEmbeddingProvider* embedding_provider = nullptr);

  // evaluate scores one pair. A profile with an empty embedding and non-empty text is
  // embedded through the provider; without a provider the vector stays absent.
  // Exceptions thrown by the provider propagate.
  [[nodiscard]] domain::MatchResult evaluate(const domain::Profile& candidate,
                                             const domain::Profile& job) const;

  // evaluate_batch scores every candidate against one job. The job vector is resolved
  // once and reused. A pair that throws is recorded in failures and the batch continues.
  // ranked is ordered by overall_score descending, then candidate_id ascending.
  [[nodiscard]] domain::BatchMatchReport evaluate_batch(
      const domain::Profile& job, const std::vector<domain::Profile>& candidates,
      const BatchOptions& options = BatchOptions{}) const;

  [[nodiscard]] const ScoreWeights& weights() const { return weights_; }

 private:
  ScoreWeights weights_;
  const embedding::IEmbeddingProvider* embedding_provider_;

  [[nodiscard]] vector::Vector resolve_embedding(const domain::Profile& profile) const;

  // Both profiles already normalized; job_vector already resolved.
  [[nodiscard]] domain::MatchResult score_pair(const domain::Profile& candidate,
                                               const domain::Profile& job,
                                               const vector::Vector& job_vector) const;
};

}  // namespace fitscore::matching
