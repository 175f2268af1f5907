#include "fitscore/matching/experience_scorer.h"
#include "fitscore/matching/soft_skill_scorer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <limits>

using namespace fitscore;
using Catch::Matchers::WithinAbs;

TEST_CASE("Experience score is the capped ratio of years", "[matching][experience]") {
  CHECK_THAT(matching::experience_score(3.0, 5.0), WithinAbs(0.6, 1e-12));
  CHECK(matching::experience_score(6.0, 5.0) == 1.0);
  CHECK(matching::experience_score(5.0, 5.0) == 1.0);
  CHECK(matching::experience_score(0.0, 5.0) == 0.0);
}

TEST_CASE("Experience without a requirement earns full credit", "[matching][experience]") {
  CHECK(matching::experience_score(0.0, 0.0) == matching::kExperienceNoRequirementScore);
  CHECK(matching::experience_score(2.0, 0.0) == 1.0);
  CHECK(matching::experience_score(2.0, -3.0) == 1.0);
}

TEST_CASE("Experience tolerates invalid inputs", "[matching][experience]") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  CHECK(matching::experience_score(-1.0, 5.0) == 0.0);
  CHECK(matching::experience_score(nan, 5.0) == 0.0);
  CHECK(matching::experience_score(3.0, nan) == 1.0);
  CHECK(matching::experience_score(inf, 5.0) == 0.0);
}

TEST_CASE("Soft-skill score is the overlap ratio of the requirement", "[matching][soft-skills]") {
  const double score = matching::soft_skill_score({"Leadership", "Communication", "Teamwork"},
                                                  {"leadership", "communication",
                                                   "problem-solving"});
  CHECK_THAT(score, WithinAbs(2.0 / 3.0, 1e-12));

  CHECK(matching::soft_skill_score({"teamwork"}, {"Teamwork"}) == 1.0);
  CHECK(matching::soft_skill_score({}, {"teamwork"}) == 0.0);
}

TEST_CASE("Soft-skill matching ignores the case of accented letters", "[matching][soft-skills]") {
  CHECK(matching::soft_skill_score({"Créativité"}, {"CRÉATIVITÉ"}) == 1.0);
  CHECK(matching::soft_skill_score({"ESPRIT D'ÉQUIPE", "Rigueur"},
                                   {"esprit d'équipe", "autonomie"}) == 0.5);
}

TEST_CASE("Soft-skill partial credit without a requirement", "[matching][soft-skills]") {
  CHECK(matching::soft_skill_score({"teamwork"}, {}) ==
        matching::kSoftSkillNoRequirementPartialCredit);
  CHECK(matching::soft_skill_score({"teamwork"}, {}) == 0.3);
  CHECK(matching::soft_skill_score({}, {}) == 0.0);
}
