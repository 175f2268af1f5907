#include "fitscore/explain/explanation_generator.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace fitscore;

namespace {

domain::Profile make_candidate(std::vector<std::string> skills, double years) {
  domain::Profile p;
  p.id = "cand-1";
  p.technical_skills = std::move(skills);
  p.experience_years = years;
  return p;
}

domain::Profile make_job(std::vector<std::string> skills, double years) {
  domain::Profile p;
  p.id = "job-1";
  p.technical_skills = std::move(skills);
  p.experience_years = years;
  return p;
}

domain::SubScoreSet uniform_scores(double value) {
  domain::SubScoreSet s;
  s.technical_skills = value;
  s.experience = value;
  s.education = value;
  s.soft_skills = value;
  return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("Explanation lists strengths and gaps in job order", "[explain]") {
  const auto candidate = make_candidate({"docker", "python"}, 3.0);
  const auto job = make_job({"python", "java", "docker"}, 5.0);

  const auto explanation = explain::explain(candidate, job, uniform_scores(0.9));

  const std::vector<std::string> strengths = {"+ Has required skill: python",
                                              "+ Has required skill: docker"};
  CHECK(explanation.strengths == strengths);

  const std::vector<std::string> gaps = {"- Missing skill: java",
                                         "- Experience gap: 3 years (required: 5)"};
  CHECK(explanation.gaps == gaps);

  const std::vector<std::string> recommendations = {
      "Highly recommended candidate",
      "Consider training in java or candidates who already have it"};
  CHECK(explanation.recommendations == recommendations);
}

TEST_CASE("Explanation compares raw experience years", "[explain]") {
  SECTION("requirement met") {
    const auto explanation = explain::explain(make_candidate({}, 6.0), make_job({}, 5.0),
                                              uniform_scores(0.5));
    CHECK(explanation.strengths ==
          std::vector<std::string>{"+ Meets experience requirement: 6 years"});
    CHECK(explanation.gaps.empty());
  }

  SECTION("close to the requirement") {
    const auto explanation = explain::explain(make_candidate({}, 4.0), make_job({}, 5.0),
                                              uniform_scores(0.5));
    CHECK(explanation.gaps ==
          std::vector<std::string>{"- Experience gap: 4 years (required: 5)"});
    REQUIRE_FALSE(explanation.recommendations.empty());
    CHECK(explanation.recommendations.back() == "Candidate has sufficient related experience");
  }

  SECTION("fractional years") {
    const auto explanation = explain::explain(make_candidate({}, 2.5), make_job({}, 0.0),
                                              uniform_scores(0.5));
    CHECK(explanation.strengths ==
          std::vector<std::string>{"+ Meets experience requirement: 2.5 years"});
  }
}

TEST_CASE("Recommendation tier uses the unweighted sub-score mean", "[explain][tier]") {
  CHECK(explain::tier_for_mean(0.8) == domain::RecommendationTier::kHighlyRecommended);
  CHECK(explain::tier_for_mean(0.95) == domain::RecommendationTier::kHighlyRecommended);
  CHECK(explain::tier_for_mean(0.6) == domain::RecommendationTier::kGoodCandidate);
  CHECK(explain::tier_for_mean(0.79) == domain::RecommendationTier::kGoodCandidate);
  CHECK(explain::tier_for_mean(0.59) == domain::RecommendationTier::kConsiderAlternatives);

  domain::SubScoreSet scores;
  scores.technical_skills = 1.0;
  scores.experience = 0.6;
  scores.education = 0.4;
  scores.soft_skills = 0.0;

  const auto explanation = explain::explain(make_candidate({}, 0.0), make_job({}, 0.0), scores);
  CHECK(explanation.coarse_overall == scores.mean());
  CHECK(explanation.tier == domain::RecommendationTier::kConsiderAlternatives);
  CHECK(explanation.recommendations.front() == "Consider alternative candidates");
}

TEST_CASE("Narrative follows the report layout", "[explain][narrative]") {
  const auto candidate = make_candidate({"python"}, 3.0);
  const auto job = make_job({"python", "java"}, 5.0);

  SECTION("with the weighted overall score") {
    const auto explanation = explain::explain(candidate, job, uniform_scores(0.5), 84.0);
    const auto& text = explanation.narrative;

    CHECK(contains(text, "Compatibility score: 84%"));
    CHECK(contains(text, "Technical skills:\n+ python\n- java (missing skill)\n"));
    CHECK(contains(text, "Experience:\n- 3 years (required: 5)\n"));
    CHECK(contains(text, "Recommendation:\nExcellent candidate"));
  }

  SECTION("falls back to the sub-score mean") {
    const auto explanation = explain::explain(candidate, job, uniform_scores(0.5));
    CHECK(contains(explanation.narrative, "Compatibility score: 50%"));
    CHECK(contains(explanation.narrative, "Consider whether the profile brings"));
  }

  SECTION("middle tier paragraph") {
    const auto explanation = explain::explain(candidate, job, uniform_scores(0.5), 65.0);
    CHECK(contains(explanation.narrative, "Good candidate with potential"));
  }
}

TEST_CASE("Interview questions", "[explain][questions]") {
  SECTION("experience and at most two missing skills") {
    const auto questions = explain::suggest_interview_questions(
        make_candidate({"python"}, 3.0), make_job({"python", "java", "go", "rust"}, 5.0));

    const std::vector<std::string> expected = {
        "Tell us about your 3 years of experience.",
        "What is your experience with java?",
        "What is your experience with go?",
        "Can you describe a recent project you are proud of?",
        "What interests you in this position?",
    };
    CHECK(questions == expected);
  }

  SECTION("no experience question without experience") {
    const auto questions =
        explain::suggest_interview_questions(make_candidate({}, 0.0), make_job({}, 0.0));
    CHECK(questions.size() == 2);
  }
}

TEST_CASE("Skills covered through a synonym are reported as related", "[explain][synonyms]") {
  const auto candidate = make_candidate({"python", "reactjs"}, 5.0);
  const auto job = make_job({"python", "react", "java"}, 5.0);

  const auto explanation = explain::explain(candidate, job, uniform_scores(0.9), 90.0);

  const std::vector<std::string> strengths = {"+ Has required skill: python",
                                              "+ Related skill: react (via synonym)",
                                              "+ Meets experience requirement: 5 years"};
  CHECK(explanation.strengths == strengths);

  const std::vector<std::string> gaps = {"- Not listed as such: react (covered by a related skill)",
                                         "- Missing skill: java"};
  CHECK(explanation.gaps == gaps);

  const std::vector<std::string> recommendations = {
      "Highly recommended candidate", "Confirm hands-on experience with react",
      "Consider training in java or candidates who already have it"};
  CHECK(explanation.recommendations == recommendations);

  CHECK(contains(explanation.narrative,
                 "Technical skills:\n+ python\n~ react (related skill)\n- java (missing skill)\n"));
  CHECK_FALSE(contains(explanation.narrative, "react (missing skill)"));
}

TEST_CASE("Candidate summary", "[explain][summary]") {
  auto candidate = make_candidate({"go", "python", "docker", "sql", "git", "linux", "rust"}, 4.5);
  candidate.title = "Backend engineer";
  auto job = make_job({"python", "go", "docker", "sql", "git", "linux", "rust", "java"}, 3.0);
  job.title = "Platform developer";

  const auto summary = explain::candidate_summary(candidate, job);

  CHECK(contains(summary, "Executive summary - cand-1\n"));
  CHECK(contains(summary, "For the position: Platform developer\n"));
  CHECK(contains(summary,
                 "Strengths for this position:\n* python\n* go\n* docker\n* sql\n* git\n\n"));
  CHECK_FALSE(contains(summary, "* linux"));
  CHECK_FALSE(contains(summary, "java"));
  CHECK(contains(summary, "Experience: 4.5 years\n"));
  CHECK(contains(summary, "Current position: Backend engineer\n"));

  SECTION("without titles") {
    const auto bare = explain::candidate_summary(make_candidate({}, 0.0), make_job({}, 0.0));
    CHECK(contains(bare, "For the position: N/A\n"));
    CHECK(contains(bare, "Experience: 0 years\n"));
    CHECK_FALSE(contains(bare, "Current position"));
  }
}

TEST_CASE("Contact email quotes matched skills and the score", "[explain][email]") {
  const auto candidate = make_candidate({"python", "docker", "sql", "git"}, 3.0);
  auto job = make_job({"git", "sql", "docker", "python"}, 2.0);
  job.title = "Data engineer";

  const auto email = explain::contact_email(candidate, job, 87.6);

  CHECK(contains(email, "Hello cand-1,\n"));
  CHECK(contains(email, "our Data engineer position"));
  CHECK(contains(email, "thanks to:\n- git\n- sql\n- docker\n\n"));
  CHECK_FALSE(contains(email, "- python"));
  CHECK(contains(email, "Compatibility score: 88%\n"));

  SECTION("score is kept in range") {
    CHECK(contains(explain::contact_email(candidate, job, 250.0), "Compatibility score: 100%"));
    CHECK(contains(explain::contact_email(candidate, job, -4.0), "Compatibility score: 0%"));
  }
}

TEST_CASE("Questions about a candidate are answered by keyword", "[explain][questions]") {
  auto candidate = make_candidate({"python", "docker", "sql", "git", "linux", "rust"}, 6.0);
  candidate.education_text = "Master en informatique";

  SECTION("experience in either language") {
    CHECK(explain::answer_question("How much experience?", candidate) ==
          "The candidate has 6 years of experience.");
    CHECK(explain::answer_question("Quelle EXPÉRIENCE a-t-il ?", candidate) ==
          "The candidate has 6 years of experience.");
  }

  SECTION("skills list the first five") {
    CHECK(explain::answer_question("Which skills?", candidate) ==
          "Technical skills include: python, docker, sql, git, linux");
  }

  SECTION("several topics in one question") {
    CHECK(explain::answer_question("Formation et compétences ?", candidate) ==
          "Technical skills include: python, docker, sql, git, linux\n"
          "Education: Master en informatique");
  }

  SECTION("unrecognized question") {
    CHECK(explain::answer_question("Salary expectations?", candidate) ==
          "See the candidate's full profile for more information.");
  }
}
