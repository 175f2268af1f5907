#include "fitscore/matching/skill_synonyms.h"

#include <map>

namespace fitscore::matching {

namespace {

std::vector<SynonymGroup> build_groups() {
  return {
      {"javascript", {"js", "ecmascript", "es6"}},
      {"typescript", {"ts"}},
      {"react", {"reactjs", "react.js"}},
      {"angular", {"angularjs", "angular.js"}},
      {"vue", {"vuejs", "vue.js"}},
      {"node", {"nodejs", "node.js"}},
      {"python", {"py", "python3"}},
      {"c++", {"cpp", "cplusplus"}},
      {"c#", {"csharp", "c sharp"}},
      {"golang", {"go"}},
      {"aws", {"amazon web services"}},
      {"gcp", {"google cloud", "google cloud platform"}},
      {"azure", {"microsoft azure"}},
      {"postgresql", {"postgres", "psql"}},
      {"mongodb", {"mongo"}},
      {"mysql", {"mariadb"}},
      {"sql", {"structured query language"}},
      {"git", {"version control", "github", "gitlab"}},
      {"docker", {"containers", "containerization"}},
      {"kubernetes", {"k8s"}},
      {"machine learning", {"ml"}},
      {"deep learning", {"dl"}},
      {"artificial intelligence", {"ai"}},
      {"natural language processing", {"nlp"}},
      {"ci/cd", {"continuous integration", "continuous delivery", "cicd"}},
      {"rest", {"rest api", "restful"}},
  };
}

// Reverse index: every member (canonical or alias) to the indices of its groups.
std::map<std::string, std::vector<std::size_t>, std::less<>> build_index(
    const std::vector<SynonymGroup>& groups) {
  std::map<std::string, std::vector<std::size_t>, std::less<>> index;
  for (std::size_t i = 0; i < groups.size(); ++i) {
    index[std::string(groups[i].canonical)].push_back(i);
    for (const auto alias : groups[i].aliases) {
      index[std::string(alias)].push_back(i);
    }
  }
  return index;
}

const std::map<std::string, std::vector<std::size_t>, std::less<>>& member_index() {
  static const auto index = build_index(synonym_groups());
  return index;
}

}  // namespace

const std::vector<SynonymGroup>& synonym_groups() {
  static const auto groups = build_groups();
  return groups;
}

std::set<std::string> expand_skills(const std::vector<std::string>& skills) {
  const auto& groups = synonym_groups();
  const auto& index = member_index();

  std::set<std::string> expanded(skills.begin(), skills.end());
  for (const auto& skill : skills) {
    const auto it = index.find(skill);
    if (it == index.end()) {
      continue;
    }
    for (const std::size_t group : it->second) {
      expanded.emplace(groups[group].canonical);
      for (const auto alias : groups[group].aliases) {
        expanded.emplace(alias);
      }
    }
  }
  return expanded;
}

}  // namespace fitscore::matching
