#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fitscore::domain {

// RecommendationTier is derived from the unweighted mean of the sub-scores.
enum class RecommendationTier {
  kHighlyRecommended,  // mean >= 0.8
  kGoodCandidate,      // mean >= 0.6
  kConsiderAlternatives,
};

constexpr std::string_view tier_name(const RecommendationTier tier) {
  switch (tier) {
    case RecommendationTier::kHighlyRecommended:
      return "highly_recommended";
    case RecommendationTier::kGoodCandidate:
      return "good_candidate";
    case RecommendationTier::kConsiderAlternatives:
      return "consider_alternatives";
  }
  return "unknown";
}

// MatchExplanation is recomputed on demand from the two profiles and their sub-scores.
// The recommendations list always starts with the tier line.
struct MatchExplanation {
  std::vector<std::string> strengths;
  std::vector<std::string> gaps;
  std::vector<std::string> recommendations;
  std::vector<std::string> interview_questions;
  std::string narrative;
  double coarse_overall{0.0};  // Unweighted mean of sub-scores, in [0,1]
  RecommendationTier tier{RecommendationTier::kConsiderAlternatives};
};

}  // namespace fitscore::domain
