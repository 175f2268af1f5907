#pragma once

#include <array>
#include <string_view>

namespace fitscore::domain {

enum class SubScore {
  kTechnicalSkills,
  kExperience,
  kEducation,
  kSoftSkills,
};

constexpr std::array<SubScore, 4> kAllSubScores = {
    SubScore::kTechnicalSkills,
    SubScore::kExperience,
    SubScore::kEducation,
    SubScore::kSoftSkills,
};

// Wire names used in JSON output and logs.
constexpr std::string_view sub_score_name(const SubScore kind) {
  switch (kind) {
    case SubScore::kTechnicalSkills:
      return "technical_skills";
    case SubScore::kExperience:
      return "experience";
    case SubScore::kEducation:
      return "education";
    case SubScore::kSoftSkills:
      return "soft_skills";
  }
  return "unknown";
}

// SubScoreSet holds one value in [0,1] per SubScore. Every key is a field, so the set
// can never be partially populated; unscored entries read 0.0.
struct SubScoreSet {
  double technical_skills{0.0};
  double experience{0.0};
  double education{0.0};
  double soft_skills{0.0};

  [[nodiscard]] double get(const SubScore kind) const {
    switch (kind) {
      case SubScore::kTechnicalSkills:
        return technical_skills;
      case SubScore::kExperience:
        return experience;
      case SubScore::kEducation:
        return education;
      case SubScore::kSoftSkills:
        return soft_skills;
    }
    return 0.0;
  }

  // mean is the unweighted average of the four values. Display blend only; ranking uses
  // matching::combine_scores.
  [[nodiscard]] double mean() const {
    return (technical_skills + experience + education + soft_skills) /
           static_cast<double>(kAllSubScores.size());
  }
};

}  // namespace fitscore::domain
