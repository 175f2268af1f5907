#include "fitscore/matching/education_scorer.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>

using namespace fitscore;
using Catch::Matchers::WithinAbs;

TEST_CASE("Degree level inference from free text", "[matching][education]") {
  SECTION("English degree names") {
    CHECK(matching::infer_degree_level("PhD in Computer Science") == matching::kLevelDoctorate);
    CHECK(matching::infer_degree_level("Ph.D. Physics") == matching::kLevelDoctorate);
    CHECK(matching::infer_degree_level("Master's degree in Data Science") ==
          matching::kLevelMaster);
    CHECK(matching::infer_degree_level("MBA") == matching::kLevelMaster);
    CHECK(matching::infer_degree_level("Bachelor of Science") == matching::kLevelBachelor);
    CHECK(matching::infer_degree_level("Associate degree in IT") == matching::kLevelAssociate);
    CHECK(matching::infer_degree_level("AWS certification") == matching::kLevelCertificate);
    CHECK(matching::infer_degree_level("High school diploma") == matching::kLevelSecondary);
  }

  SECTION("French degree names, accents folded") {
    CHECK(matching::infer_degree_level("Doctorat en informatique") == matching::kLevelDoctorate);
    CHECK(matching::infer_degree_level("Diplôme d'Ingénieur") == matching::kLevelMaster);
    CHECK(matching::infer_degree_level("Licence professionnelle") == matching::kLevelBachelor);
    CHECK(matching::infer_degree_level("BTS Informatique") == matching::kLevelAssociate);
    CHECK(matching::infer_degree_level("Baccalauréat scientifique") ==
          matching::kLevelSecondary);
    CHECK(matching::infer_degree_level("Lycée") == matching::kLevelSecondary);
  }

  SECTION("longest keyword wins at a position") {
    CHECK(matching::infer_degree_level("Bac+5") == matching::kLevelMaster);
    CHECK(matching::infer_degree_level("BAC+2 DUT") == matching::kLevelAssociate);
    CHECK(matching::infer_degree_level("Bac") == matching::kLevelSecondary);
  }

  SECTION("highest level across several entries") {
    CHECK(matching::infer_degree_level("Bachelor (2015); Master (2017)") ==
          matching::kLevelMaster);
  }

  SECTION("keywords match whole words only") {
    CHECK(matching::infer_degree_level("Worked at the embassy") == matching::kLevelUnknown);
    CHECK(matching::infer_degree_level("Self-taught") == matching::kLevelUnknown);
    CHECK(matching::infer_degree_level("") == matching::kLevelUnknown);
  }
}

TEST_CASE("Education scoring policy", "[matching][education]") {
  SECTION("unknown education against a stated requirement") {
    CHECK_THAT(matching::education_score("", "Master"), WithinAbs(0.2, 1e-12));
  }

  SECTION("meeting the requirement") {
    CHECK_THAT(matching::education_score("MSc", "Master"), WithinAbs(0.85, 1e-12));
  }

  SECTION("exceeding the requirement adds a capped bonus") {
    CHECK_THAT(matching::education_score_for_levels(3.5, 2.5), WithinAbs(0.95, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(4.0, 2.5), WithinAbs(1.0, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(4.0, 0.7), WithinAbs(1.0, 1e-12));
  }

  SECTION("falling short is floored and never beats meeting the bar") {
    CHECK_THAT(matching::education_score_for_levels(2.5, 4.0), WithinAbs(0.625, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(0.7, 3.5), WithinAbs(0.3, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(3.5, 4.0), WithinAbs(0.85, 1e-12));
  }

  SECTION("no stated requirement") {
    CHECK_THAT(matching::education_score_for_levels(2.5, 0.0), WithinAbs(1.0, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(0.7, 0.0), WithinAbs(0.74, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(1.2, 0.0), WithinAbs(0.84, 1e-12));
    CHECK_THAT(matching::education_score_for_levels(0.0, 0.0), WithinAbs(0.4, 1e-12));
    CHECK_THAT(matching::education_score("", ""), WithinAbs(0.4, 1e-12));
  }
}

TEST_CASE("Education score is monotone in candidate level", "[matching][education]") {
  constexpr std::array<double, 7> kLevels = {
      matching::kLevelUnknown,   matching::kLevelSecondary, matching::kLevelCertificate,
      matching::kLevelAssociate, matching::kLevelBachelor,  matching::kLevelMaster,
      matching::kLevelDoctorate,
  };

  for (const double required : kLevels) {
    double previous = -1.0;
    for (const double candidate : kLevels) {
      const double score = matching::education_score_for_levels(candidate, required);
      CHECK(score >= 0.0);
      CHECK(score <= 1.0);
      CHECK(score >= previous);
      previous = score;
    }
  }
}
