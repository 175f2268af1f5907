#include "fitscore/embedding/embedding_provider.h"
#include "fitscore/matching/detailed_scorer.h"
#include "fitscore/matching/matcher.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>
#include <vector>

using namespace fitscore;
using Catch::Matchers::WithinAbs;

namespace {

domain::Profile scenario_candidate() {
  domain::Profile p;
  p.id = "cand-1";
  p.technical_skills = {"Python", "ReactJS", "AWS"};
  p.experience_years = 3.0;
  p.education_text = "Master of Science in Computer Science";
  return p;
}

domain::Profile scenario_job() {
  domain::Profile p;
  p.id = "job-1";
  p.title = "Full-stack developer";
  p.technical_skills = {"Python", "React", "Amazon Web Services"};
  p.experience_years = 5.0;
  p.education_text = "Bachelor's degree";
  return p;
}

bool in_unit_range(double v) {
  return v >= 0.0 && v <= 1.0;
}

}  // namespace

TEST_CASE("detailed_scores on the reference scenario", "[matching][detailed]") {
  const auto scores = matching::detailed_scores(scenario_candidate(), scenario_job());

  CHECK_THAT(scores.technical_skills, WithinAbs(1.0, 1e-12));
  CHECK_THAT(scores.experience, WithinAbs(0.6, 1e-12));
  CHECK_THAT(scores.education, WithinAbs(0.95, 1e-12));
  CHECK(scores.soft_skills == 0.0);
}

TEST_CASE("detailed_scores is total and bounded", "[matching][detailed]") {
  std::vector<domain::Profile> profiles;
  profiles.push_back(domain::Profile{});
  profiles.push_back(scenario_candidate());
  profiles.push_back(scenario_job());

  domain::Profile odd;
  odd.technical_skills = {"", "   ", "C#", "c#"};
  odd.soft_skills = {"Teamwork"};
  odd.experience_years = -4.0;
  odd.education_text = "Bac+8";
  profiles.push_back(odd);

  domain::Profile broken;
  broken.experience_years = std::numeric_limits<double>::quiet_NaN();
  broken.education_text = "???";
  profiles.push_back(broken);

  for (const auto& candidate : profiles) {
    for (const auto& job : profiles) {
      const auto scores = matching::detailed_scores(candidate, job);
      for (const auto kind : domain::kAllSubScores) {
        CHECK(in_unit_range(scores.get(kind)));
      }
    }
  }
}

TEST_CASE("Matcher evaluates a pair end to end", "[matching][matcher]") {
  auto candidate = scenario_candidate();
  auto job = scenario_job();
  candidate.embedding = {1.0f, 0.0f, 0.0f};
  job.embedding = {1.0f, 0.0f, 0.0f};

  const matching::Matcher matcher;
  const auto result = matcher.evaluate(candidate, job);

  CHECK(result.candidate_id == "cand-1");
  CHECK(result.job_id == "job-1");
  CHECK_THAT(result.similarity, WithinAbs(1.0, 1e-9));
  CHECK_FALSE(result.similarity_fallback);
  // 0.5*1.0 + 0.3*1.0 + 0.15*0.6 + 0.05*0.95 = 0.9375
  CHECK_THAT(result.overall_score, WithinAbs(93.75, 1e-9));
  CHECK(result.explanation.tier == domain::RecommendationTier::kGoodCandidate);
  CHECK(result.explanation.narrative.find("Compatibility score: 94%") != std::string::npos);
}

TEST_CASE("Matcher falls back without embeddings", "[matching][matcher]") {
  const matching::Matcher matcher;
  const auto result = matcher.evaluate(scenario_candidate(), scenario_job());

  CHECK(result.similarity_fallback);
  CHECK(result.similarity == 0.75);
}

TEST_CASE("Matcher embeds profile text through the provider", "[matching][matcher]") {
  const embedding::DeterministicStubEmbeddingProvider provider(128);
  const matching::Matcher matcher(matching::ScoreWeights{}, &provider);

  auto candidate = scenario_candidate();
  auto job = scenario_job();
  candidate.text = "Python developer building React front ends on AWS";
  job.text = "We need a Python developer for React and AWS work";

  const auto result = matcher.evaluate(candidate, job);
  CHECK_FALSE(result.similarity_fallback);
  CHECK(result.similarity > 0.0);
  CHECK(result.similarity <= 1.0);
}

TEST_CASE("Matcher normalizes profiles before scoring", "[matching][matcher]") {
  auto candidate = scenario_candidate();
  candidate.id = "  cand-1 ";
  candidate.technical_skills = {" PYTHON", "reactjs ", "aws", "AWS"};

  const matching::Matcher matcher;
  const auto result = matcher.evaluate(candidate, scenario_job());
  CHECK(result.candidate_id == "cand-1");
  CHECK_THAT(result.sub_scores.technical_skills, WithinAbs(1.0, 1e-12));
}
