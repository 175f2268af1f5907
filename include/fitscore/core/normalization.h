#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fitscore::core {

// Deterministic normalization utilities shared by every scorer.
// All functions are locale-independent and produce byte-stable output
// across platforms and compilers:
// - ASCII lowercasing via explicit char math (no std::tolower)
// - Whitespace set: space, tab, CR, LF
// - Diacritic folding covers UTF-8 Latin-1 Supplement and common Latin Extended-A letters

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

inline bool is_ascii_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

// trim removes leading and trailing whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// tokenize_ascii splits input on non-alphanumeric delimiters into lowercase tokens.
// Tokens shorter than min_length are dropped. Tokens are returned in encounter order.
std::vector<std::string> tokenize_ascii(std::string_view input, std::size_t min_length = 2);

// fold_diacritics replaces accented UTF-8 letters with their unaccented ASCII base
// ("é" -> "e", "Ü" -> "U", "œ" -> "oe", "ß" -> "ss"). Other bytes pass through unchanged.
std::string fold_diacritics(std::string_view input);

// lower_latin_utf8 lowercases ASCII letters and the UTF-8 capitals of Latin-1
// Supplement (U+00C0..U+00DE) and Latin Extended-A (U+0100..U+017F), keeping the
// accents ("RÉSEAUX" -> "réseaux", "ŁÓDŹ" -> "łódź"). Other bytes pass through unchanged.
std::string lower_latin_utf8(std::string_view input);

// normalize_skill produces the canonical form of a single skill token:
// trimmed, lowercased with lower_latin_utf8, inner whitespace runs collapsed to one space.
// Returns an empty string for blank input.
std::string normalize_skill(std::string_view skill);

// normalize_skill_list normalizes every entry, drops blanks and collapses duplicates.
// First-occurrence order is preserved for display; matching code treats the result as a set.
// Idempotent: normalize_skill_list(normalize_skill_list(s)) == normalize_skill_list(s).
std::vector<std::string> normalize_skill_list(const std::vector<std::string>& skills);

}  // namespace fitscore::core
