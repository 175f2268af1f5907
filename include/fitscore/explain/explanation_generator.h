#pragma once

#include "fitscore/domain/match_explanation.h"
#include "fitscore/domain/profile.h"
#include "fitscore/domain/sub_scores.h"

#include <optional>
#include <string>
#include <vector>

namespace fitscore::explain {

// Tier thresholds on the unweighted sub-score mean (display blend, [0,1]).
constexpr double kHighlyRecommendedThreshold = 0.8;
constexpr double kGoodCandidateThreshold = 0.6;

// A candidate short of the experience requirement but above this fraction of it is
// called out as having sufficient related experience.
constexpr double kRelatedExperienceFraction = 0.7;

// At most this many missing skills get their own interview question.
constexpr std::size_t kMaxSkillQuestions = 2;

// Matched skills listed by the candidate summary, the contact email and answer_question.
constexpr std::size_t kSummaryMaxSkills = 5;
constexpr std::size_t kEmailMaxSkills = 3;
constexpr std::size_t kAnswerMaxSkills = 5;

[[nodiscard]] domain::RecommendationTier tier_for_mean(double coarse_overall);

// explain builds the templated explanation for a candidate/job pair.
// - strengths: exact matches, then synonym-only (related) matches, in the job's skill
//   order, followed by one experience line comparing the raw years
// - gaps: one line per job skill the candidate does not list verbatim; a skill covered
//   by a related skill says so instead of reporting it missing
// - recommendations: the tier line first, then one line per skill gap (training for a
//   missing skill, verification for a related one), then the related-experience line
//   when it applies
// - narrative: report layout; its score line and recommendation paragraph use
//   overall_score (0-100) when supplied, otherwise the sub-score mean x 100
[[nodiscard]] domain::MatchExplanation explain(const domain::Profile& candidate,
                                               const domain::Profile& job,
                                               const domain::SubScoreSet& scores,
                                               std::optional<double> overall_score = std::nullopt);

// suggest_interview_questions proposes questions for the interviewer.
[[nodiscard]] std::vector<std::string> suggest_interview_questions(
    const domain::Profile& candidate, const domain::Profile& job);

// candidate_summary is a short executive summary of the candidate for one job: the first
// kSummaryMaxSkills exact matches, years of experience and the candidate's title.
[[nodiscard]] std::string candidate_summary(const domain::Profile& candidate,
                                            const domain::Profile& job);

// contact_email drafts a first-contact email quoting up to kEmailMaxSkills matched skills
// and the compatibility score (0-100, rounded).
[[nodiscard]] std::string contact_email(const domain::Profile& candidate,
                                        const domain::Profile& job, double overall_score);

// answer_question answers a recruiter question about the candidate by keyword (English or
// French): experience, skills, projects, education. Unrecognized questions get a pointer
// to the full profile.
[[nodiscard]] std::string answer_question(const std::string& question,
                                          const domain::Profile& candidate);

}  // namespace fitscore::explain
