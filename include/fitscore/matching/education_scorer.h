#pragma once

#include <string_view>

namespace fitscore::matching {

// Ordinal degree levels inferred from education text.
constexpr double kLevelDoctorate = 4.0;
constexpr double kLevelMaster = 3.5;  // Master's and engineering degrees
constexpr double kLevelBachelor = 2.5;
constexpr double kLevelAssociate = 1.5;
constexpr double kLevelCertificate = 1.2;
constexpr double kLevelSecondary = 0.7;
constexpr double kLevelUnknown = 0.0;

// Scoring constants.
constexpr double kEducationUnknownWithRequirement = 0.2;
constexpr double kEducationMeetsRequirement = 0.85;
constexpr double kEducationExceedBonusPerLevel = 0.1;
constexpr double kEducationExceedBonusCap = 0.2;
constexpr double kEducationShortfallFloor = 0.3;
constexpr double kEducationNoRequirementBase = 0.6;
constexpr double kEducationNoRequirementDivisor = 5.0;
constexpr double kEducationNoRequirementUnknown = 0.4;

// infer_degree_level maps free text to the highest degree level it mentions.
// The text is diacritic-folded and lowercased, then scanned left to right for the longest
// keyword starting at each word boundary ("bac+5" wins over "bac"). Keywords cover
// English and French naming ("phd", "doctorat", "ingenieur", "licence", "bts", ...).
// Returns kLevelUnknown when nothing matches.
[[nodiscard]] double infer_degree_level(std::string_view education_text);

// education_score_for_levels applies the scoring policy to inferred levels
// (candidate c, required r):
// - r > 0, c <= 0: kEducationUnknownWithRequirement
// - c >= r > 0:    min(1, 0.85 + min(0.2, (c - r) * 0.1))
// - 0 < c < r:     max(0.3, c / r), capped at 0.85 so falling short never beats meeting
// - r == 0:        min(1, 0.6 + c / 5) if c > 0, else 0.4
[[nodiscard]] double education_score_for_levels(double candidate_level, double required_level);

// education_score infers both levels and applies education_score_for_levels.
[[nodiscard]] double education_score(std::string_view candidate_education,
                                     std::string_view required_education);

}  // namespace fitscore::matching
