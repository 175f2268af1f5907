#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace fitscore::matching {

// SynonymGroup lists a canonical skill and the aliases accepted for it.
// All entries are in normalized form (see core::normalize_skill).
struct SynonymGroup {
  std::string_view canonical;
  std::vector<std::string_view> aliases;
};

// synonym_groups returns the built-in synonym table (immutable, built on first use).
[[nodiscard]] const std::vector<SynonymGroup>& synonym_groups();

// expand_skills returns the input set plus every canonical name and alias of each group
// an input skill belongs to. Expansion is symmetric: an alias pulls in its canonical name
// and the sibling aliases. A skill listed in several groups pulls in all of them.
// Input must already be normalized.
[[nodiscard]] std::set<std::string> expand_skills(const std::vector<std::string>& skills);

}  // namespace fitscore::matching
