#include "fitscore/explain/explanation_generator.h"

#include "fitscore/core/normalization.h"
#include "fitscore/matching/skill_matcher.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace fitscore::explain {

namespace {

bool is_related(const matching::SkillOverlap& overlap, const std::string& skill);

// Prints 5 as "5" and 2.5 as "2.5".
std::string format_years(const double years) {
  std::ostringstream out;
  out << (std::isfinite(years) && years > 0.0 ? years : 0.0);
  return out.str();
}

std::string format_percent(const double score_0_100) {
  std::ostringstream out;
  out << std::lround(score_0_100) << "%";
  return out.str();
}

std::string recommendation_paragraph(const double score_0_100) {
  if (score_0_100 >= kHighlyRecommendedThreshold * 100.0) {
    return "Excellent candidate, highly recommended for this position.\n";
  }
  if (score_0_100 >= kGoodCandidateThreshold * 100.0) {
    return "Good candidate with potential; evaluate gaps and training possibilities.\n";
  }
  return "Consider whether the profile brings complementary value; otherwise explore other "
         "candidates.\n";
}

std::string tier_line(const domain::RecommendationTier tier) {
  switch (tier) {
    case domain::RecommendationTier::kHighlyRecommended:
      return "Highly recommended candidate";
    case domain::RecommendationTier::kGoodCandidate:
      return "Good candidate with potential";
    case domain::RecommendationTier::kConsiderAlternatives:
      return "Consider alternative candidates";
  }
  return "Consider alternative candidates";
}

std::string build_narrative(const matching::SkillOverlap& overlap, const double candidate_years,
                            const double required_years, const double score_0_100) {
  std::ostringstream out;
  out << "Compatibility score: " << format_percent(score_0_100) << "\n\n";
  out << "Detailed analysis:\n\n";

  out << "Technical skills:\n";
  for (const auto& skill : overlap.matched) {
    out << "+ " << skill << "\n";
  }
  for (const auto& skill : overlap.related) {
    out << "~ " << skill << " (related skill)\n";
  }
  for (const auto& skill : overlap.missing) {
    if (!is_related(overlap, skill)) {
      out << "- " << skill << " (missing skill)\n";
    }
  }
  out << "\n";

  out << "Experience:\n";
  if (candidate_years >= required_years) {
    out << "+ " << format_years(candidate_years) << " years experience (required: "
        << format_years(required_years) << ")\n";
  } else {
    out << "- " << format_years(candidate_years) << " years (required: "
        << format_years(required_years) << ")\n";
  }
  out << "\n";

  out << "Recommendation:\n" << recommendation_paragraph(score_0_100);
  return out.str();
}

bool is_related(const matching::SkillOverlap& overlap, const std::string& skill) {
  return std::find(overlap.related.begin(), overlap.related.end(), skill) !=
         overlap.related.end();
}

bool mentions(const std::string& text, std::initializer_list<const char*> keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [&text](const char* keyword) {
    return text.find(keyword) != std::string::npos;
  });
}

std::string join_first(const std::vector<std::string>& items, const std::size_t limit,
                       const std::string& separator) {
  std::string joined;
  for (std::size_t i = 0; i < items.size() && i < limit; ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += items[i];
  }
  return joined;
}

double sanitize_years(const double years) {
  return (std::isfinite(years) && years > 0.0) ? years : 0.0;
}

}  // namespace

domain::RecommendationTier tier_for_mean(const double coarse_overall) {
  if (coarse_overall >= kHighlyRecommendedThreshold) {
    return domain::RecommendationTier::kHighlyRecommended;
  }
  if (coarse_overall >= kGoodCandidateThreshold) {
    return domain::RecommendationTier::kGoodCandidate;
  }
  return domain::RecommendationTier::kConsiderAlternatives;
}

domain::MatchExplanation explain(const domain::Profile& candidate, const domain::Profile& job,
                                 const domain::SubScoreSet& scores,
                                 const std::optional<double> overall_score) {
  domain::MatchExplanation explanation;
  const auto overlap = matching::skill_overlap(candidate.technical_skills, job.technical_skills);

  for (const auto& skill : overlap.matched) {
    explanation.strengths.push_back("+ Has required skill: " + skill);
  }
  for (const auto& skill : overlap.related) {
    explanation.strengths.push_back("+ Related skill: " + skill + " (via synonym)");
  }
  for (const auto& skill : overlap.missing) {
    if (is_related(overlap, skill)) {
      explanation.gaps.push_back("- Not listed as such: " + skill +
                                 " (covered by a related skill)");
      explanation.recommendations.push_back("Confirm hands-on experience with " + skill);
      continue;
    }
    explanation.gaps.push_back("- Missing skill: " + skill);
    explanation.recommendations.push_back("Consider training in " + skill +
                                          " or candidates who already have it");
  }

  const double candidate_years = sanitize_years(candidate.experience_years);
  const double required_years = sanitize_years(job.experience_years);
  if (candidate_years >= required_years) {
    explanation.strengths.push_back("+ Meets experience requirement: " +
                                    format_years(candidate_years) + " years");
  } else {
    explanation.gaps.push_back("- Experience gap: " + format_years(candidate_years) +
                               " years (required: " + format_years(required_years) + ")");
    if (candidate_years >= required_years * kRelatedExperienceFraction) {
      explanation.recommendations.push_back("Candidate has sufficient related experience");
    }
  }

  explanation.coarse_overall = scores.mean();
  explanation.tier = tier_for_mean(explanation.coarse_overall);
  explanation.recommendations.insert(explanation.recommendations.begin(),
                                     tier_line(explanation.tier));

  const double narrative_score = (overall_score.has_value() && std::isfinite(*overall_score))
                                     ? *overall_score
                                     : explanation.coarse_overall * 100.0;
  explanation.narrative =
      build_narrative(overlap, candidate_years, required_years, narrative_score);
  explanation.interview_questions = suggest_interview_questions(candidate, job);

  return explanation;
}

std::vector<std::string> suggest_interview_questions(const domain::Profile& candidate,
                                                     const domain::Profile& job) {
  std::vector<std::string> questions;

  const double years = sanitize_years(candidate.experience_years);
  if (years > 0.0) {
    questions.push_back("Tell us about your " + format_years(years) + " years of experience.");
  }

  const auto overlap = matching::skill_overlap(candidate.technical_skills, job.technical_skills);
  for (std::size_t i = 0; i < overlap.missing.size() && i < kMaxSkillQuestions; ++i) {
    questions.push_back("What is your experience with " + overlap.missing[i] + "?");
  }

  questions.push_back("Can you describe a recent project you are proud of?");
  questions.push_back("What interests you in this position?");

  return questions;
}

std::string candidate_summary(const domain::Profile& candidate, const domain::Profile& job) {
  const auto overlap = matching::skill_overlap(candidate.technical_skills, job.technical_skills);

  std::ostringstream out;
  out << "Executive summary - " << (candidate.id.empty() ? "Candidate" : candidate.id)
      << "\n\n";
  out << "For the position: " << (job.title.empty() ? "N/A" : job.title) << "\n\n";

  out << "Strengths for this position:\n";
  for (std::size_t i = 0; i < overlap.matched.size() && i < kSummaryMaxSkills; ++i) {
    out << "* " << overlap.matched[i] << "\n";
  }
  out << "\n";

  out << "Experience: " << format_years(candidate.experience_years) << " years\n";
  if (!candidate.title.empty()) {
    out << "Current position: " << candidate.title << "\n";
  }
  return out.str();
}

std::string contact_email(const domain::Profile& candidate, const domain::Profile& job,
                          const double overall_score) {
  const auto overlap = matching::skill_overlap(candidate.technical_skills, job.technical_skills);

  std::ostringstream out;
  out << "Hello" << (candidate.id.empty() ? "" : " " + candidate.id) << ",\n\n";
  out << "We reviewed your profile and think you may be interested in our "
      << (job.title.empty() ? "open" : job.title) << " position.\n\n";

  out << "Your profile is a strong fit for this role thanks to:\n";
  for (std::size_t i = 0; i < overlap.matched.size() && i < kEmailMaxSkills; ++i) {
    out << "- " << overlap.matched[i] << "\n";
  }
  out << "\n";

  out << "Compatibility score: "
      << format_percent(std::isfinite(overall_score) ? std::clamp(overall_score, 0.0, 100.0)
                                                     : 0.0)
      << "\n\n";
  out << "We would be glad to discuss it with you.\n\n";
  out << "Best regards,\n";
  out << "The recruiting team\n";
  return out.str();
}

std::string answer_question(const std::string& question, const domain::Profile& candidate) {
  const std::string lowered = core::lower_latin_utf8(question);
  std::vector<std::string> answers;

  if (mentions(lowered, {"experience", "expérience"})) {
    answers.push_back("The candidate has " + format_years(candidate.experience_years) +
                      " years of experience.");
  }
  if (mentions(lowered, {"skill", "compétence"}) && !candidate.technical_skills.empty()) {
    answers.push_back("Technical skills include: " +
                      join_first(candidate.technical_skills, kAnswerMaxSkills, ", "));
  }
  if (mentions(lowered, {"project", "projet"})) {
    answers.push_back("Projects mentioned in the profile are reviewed in detail at interview.");
  }
  if (mentions(lowered, {"education", "formation", "degree", "diplôme"})) {
    answers.push_back("Education: " +
                      (candidate.education_text.empty() ? std::string("N/A")
                                                        : candidate.education_text));
  }

  if (answers.empty()) {
    return "See the candidate's full profile for more information.";
  }
  return join_first(answers, answers.size(), "\n");
}

}  // namespace fitscore::explain
