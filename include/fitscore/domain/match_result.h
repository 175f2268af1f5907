#pragma once

#include "fitscore/domain/match_explanation.h"
#include "fitscore/domain/sub_scores.h"

#include <cstddef>
#include <string>
#include <vector>

namespace fitscore::domain {

// MatchResult is the final output for one candidate/job pair.
struct MatchResult {
  std::string candidate_id;
  std::string job_id;
  double similarity{0.0};            // Embedding similarity in [0,1]
  bool similarity_fallback{false};   // True when the fallback constant was used
  SubScoreSet sub_scores;
  double overall_score{0.0};         // Weighted blend in [0,100], 2 decimals
  MatchExplanation explanation;
};

// BatchFailure records a pair whose evaluation raised; the rest of the batch continues.
struct BatchFailure {
  std::string candidate_id;
  std::size_t candidate_index{0};
  std::string message;
};

// BatchMatchReport ranks N candidates against one job.
// ranked: overall_score descending, ties by candidate_id ascending.
struct BatchMatchReport {
  std::string job_id;
  std::size_t evaluated{0};  // Candidates scored successfully (before top_k truncation)
  std::vector<MatchResult> ranked;
  std::vector<BatchFailure> failures;
};

}  // namespace fitscore::domain
