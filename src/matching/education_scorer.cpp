#include "fitscore/matching/education_scorer.h"

#include "fitscore/core/normalization.h"

#include <algorithm>
#include <string>
#include <vector>

namespace fitscore::matching {

namespace {

struct DegreeKeyword {
  std::string_view keyword;
  double level;
};

// Sorted longest first so the scan takes the longest keyword at each position.
std::vector<DegreeKeyword> build_keywords() {
  std::vector<DegreeKeyword> keywords = {
      // Doctorate
      {"phd", kLevelDoctorate},
      {"ph.d", kLevelDoctorate},
      {"ph.d.", kLevelDoctorate},
      {"doctorate", kLevelDoctorate},
      {"doctoral", kLevelDoctorate},
      {"doctorat", kLevelDoctorate},
      {"bac+8", kLevelDoctorate},
      // Master / engineering degree
      {"master", kLevelMaster},
      {"masters", kLevelMaster},
      {"mastere", kLevelMaster},
      {"msc", kLevelMaster},
      {"m.sc", kLevelMaster},
      {"mba", kLevelMaster},
      {"meng", kLevelMaster},
      {"ingenieur", kLevelMaster},
      {"engineering degree", kLevelMaster},
      {"engineer degree", kLevelMaster},
      {"bac+5", kLevelMaster},
      // Bachelor / licence
      {"bachelor", kLevelBachelor},
      {"bachelors", kLevelBachelor},
      {"licence", kLevelBachelor},
      {"license", kLevelBachelor},
      {"bsc", kLevelBachelor},
      {"b.sc", kLevelBachelor},
      {"beng", kLevelBachelor},
      {"undergraduate", kLevelBachelor},
      {"bac+3", kLevelBachelor},
      // Associate / diploma
      {"associate", kLevelAssociate},
      {"associate degree", kLevelAssociate},
      {"diploma", kLevelAssociate},
      {"dut", kLevelAssociate},
      {"bts", kLevelAssociate},
      {"deug", kLevelAssociate},
      {"bac+2", kLevelAssociate},
      // Certificate
      {"certificate", kLevelCertificate},
      {"certification", kLevelCertificate},
      {"certificat", kLevelCertificate},
      // Secondary school
      {"high school", kLevelSecondary},
      {"high school diploma", kLevelSecondary},
      {"secondary school diploma", kLevelSecondary},
      {"secondary school", kLevelSecondary},
      {"baccalaureat", kLevelSecondary},
      {"baccalaureate", kLevelSecondary},
      {"bac", kLevelSecondary},
      {"lycee", kLevelSecondary},
      {"ged", kLevelSecondary},
  };

  std::stable_sort(keywords.begin(), keywords.end(),
                   [](const DegreeKeyword& a, const DegreeKeyword& b) {
                     return a.keyword.size() > b.keyword.size();
                   });
  return keywords;
}

const std::vector<DegreeKeyword>& degree_keywords() {
  static const auto keywords = build_keywords();
  return keywords;
}

bool at_word_end(const std::string& text, const std::size_t pos) {
  return pos >= text.size() || !core::is_ascii_alnum(text[pos]);
}

}  // namespace

double infer_degree_level(const std::string_view education_text) {
  const std::string text = core::normalize_ascii_lower(core::fold_diacritics(education_text));
  const auto& keywords = degree_keywords();

  double level = kLevelUnknown;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (pos > 0 && core::is_ascii_alnum(text[pos - 1])) {
      ++pos;
      continue;
    }

    std::size_t advance = 1;
    for (const auto& entry : keywords) {
      const auto& keyword = entry.keyword;
      if (text.compare(pos, keyword.size(), keyword) == 0 &&
          at_word_end(text, pos + keyword.size())) {
        level = std::max(level, entry.level);
        advance = keyword.size();
        break;
      }
    }
    pos += advance;
  }

  return level;
}

double education_score_for_levels(const double candidate_level, const double required_level) {
  if (required_level > 0.0) {
    if (candidate_level <= 0.0) {
      return kEducationUnknownWithRequirement;
    }
    if (candidate_level >= required_level) {
      const double bonus = std::min(kEducationExceedBonusCap,
                                    (candidate_level - required_level) *
                                        kEducationExceedBonusPerLevel);
      return std::min(1.0, kEducationMeetsRequirement + bonus);
    }
    const double ratio = std::max(kEducationShortfallFloor, candidate_level / required_level);
    return std::min(kEducationMeetsRequirement, ratio);
  }

  if (candidate_level > 0.0) {
    return std::min(1.0, kEducationNoRequirementBase +
                             candidate_level / kEducationNoRequirementDivisor);
  }
  return kEducationNoRequirementUnknown;
}

double education_score(const std::string_view candidate_education,
                       const std::string_view required_education) {
  return education_score_for_levels(infer_degree_level(candidate_education),
                                    infer_degree_level(required_education));
}

}  // namespace fitscore::matching
