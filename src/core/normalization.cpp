#include "fitscore/core/normalization.h"

#include <array>
#include <cstdint>
#include <set>

namespace fitscore::core {

namespace {

// Folding table for the two-byte UTF-8 range 0xC3 0x80..0xBF (U+00C0..U+00FF).
// Index is (second byte - 0x80). Empty entries pass through unchanged.
constexpr std::array<const char*, 64> kLatin1Fold = {
    "A", "A", "A", "A", "A", "A", "AE", "C",   // U+00C0..U+00C7
    "E", "E", "E", "E", "I", "I", "I",  "I",   // U+00C8..U+00CF
    "D", "N", "O", "O", "O", "O", "O",  "",    // U+00D0..U+00D7 (multiplication sign kept)
    "O", "U", "U", "U", "U", "Y", "TH", "ss",  // U+00D8..U+00DF
    "a", "a", "a", "a", "a", "a", "ae", "c",   // U+00E0..U+00E7
    "e", "e", "e", "e", "i", "i", "i",  "i",   // U+00E8..U+00EF
    "d", "n", "o", "o", "o", "o", "o",  "",    // U+00F0..U+00F7 (division sign kept)
    "o", "u", "u", "u", "u", "y", "th", "y",   // U+00F8..U+00FF
};

// Latin Extended-A letters that appear in European names and degree titles.
struct ExtendedFold {
  unsigned char lead;
  unsigned char trail;
  const char* replacement;
};

constexpr std::array<ExtendedFold, 12> kExtendedFold = {{
    {0xC5, 0x92, "OE"},  // Œ
    {0xC5, 0x93, "oe"},  // œ
    {0xC5, 0xA0, "S"},   // Š
    {0xC5, 0xA1, "s"},   // š
    {0xC5, 0xBD, "Z"},   // Ž
    {0xC5, 0xBE, "z"},   // ž
    {0xC4, 0x8C, "C"},   // Č
    {0xC4, 0x8D, "c"},   // č
    {0xC5, 0x81, "L"},   // Ł
    {0xC5, 0x82, "l"},   // ł
    {0xC4, 0x9E, "G"},   // Ğ
    {0xC4, 0x9F, "g"},   // ğ
}};

// Lowercase counterpart of a Latin Extended-A code point (U+0100..U+017F).
// Returns cp unchanged when it has no single-code-point lowercase form.
std::uint32_t lower_extended_a(const std::uint32_t cp) {
  if (cp >= 0x100 && cp <= 0x137 && cp % 2 == 0 && cp != 0x130) {
    return cp + 1;
  }
  if (cp >= 0x139 && cp <= 0x148 && cp % 2 == 1) {
    return cp + 1;
  }
  if (cp >= 0x14A && cp <= 0x177 && cp % 2 == 0) {
    return cp + 1;
  }
  if (cp == 0x178) {
    return 0xFF;  // Ÿ -> ÿ
  }
  if (cp >= 0x179 && cp <= 0x17E && cp % 2 == 1) {
    return cp + 1;
  }
  return cp;
}

}  // namespace

std::string lower_latin_utf8(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (lead >= 'A' && lead <= 'Z') {
      result.push_back(static_cast<char>(lead + ('a' - 'A')));
      ++i;
      continue;
    }
    if (i + 1 < input.size()) {
      const auto trail = static_cast<unsigned char>(input[i + 1]);
      const bool continuation = (trail & 0xC0) == 0x80;

      // U+00C0..U+00DE except U+00D7: lowercase is 0x20 higher in the trail byte.
      if (lead == 0xC3 && trail >= 0x80 && trail <= 0x9E && trail != 0x97) {
        result.push_back(static_cast<char>(lead));
        result.push_back(static_cast<char>(trail + 0x20));
        i += 2;
        continue;
      }

      if ((lead == 0xC4 || lead == 0xC5) && continuation) {
        const std::uint32_t cp = ((lead & 0x1Fu) << 6) | (trail & 0x3Fu);
        const std::uint32_t lower = lower_extended_a(cp);
        result.push_back(static_cast<char>(0xC0 | (lower >> 6)));
        result.push_back(static_cast<char>(0x80 | (lower & 0x3F)));
        i += 2;
        continue;
      }
    }

    result.push_back(input[i]);
    ++i;
  }

  return result;
}

std::vector<std::string> tokenize_ascii(const std::string_view input,
                                        const std::size_t min_length) {
  std::vector<std::string> tokens;
  std::string current;

  auto flush = [&]() {
    if (!current.empty() && current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

std::string fold_diacritics(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (i + 1 < input.size()) {
      const auto trail = static_cast<unsigned char>(input[i + 1]);

      if (lead == 0xC3 && trail >= 0x80 && trail <= 0xBF) {
        const char* folded = kLatin1Fold[trail - 0x80];
        if (*folded != '\0') {
          result += folded;
          i += 2;
          continue;
        }
      }

      bool matched = false;
      for (const auto& entry : kExtendedFold) {
        if (entry.lead == lead && entry.trail == trail) {
          result += entry.replacement;
          matched = true;
          break;
        }
      }
      if (matched) {
        i += 2;
        continue;
      }
    }

    result.push_back(input[i]);
    ++i;
  }

  return result;
}

std::string normalize_skill(const std::string_view skill) {
  const std::string lowered = lower_latin_utf8(trim(skill));

  std::string result;
  result.reserve(lowered.size());
  bool pending_space = false;
  for (const char ch : lowered) {
    if (is_ascii_space(ch)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !result.empty()) {
      result.push_back(' ');
    }
    pending_space = false;
    result.push_back(ch);
  }

  return result;
}

std::vector<std::string> normalize_skill_list(const std::vector<std::string>& skills) {
  std::vector<std::string> result;
  result.reserve(skills.size());
  std::set<std::string> seen;

  for (const auto& skill : skills) {
    std::string normalized = normalize_skill(skill);
    if (normalized.empty()) {
      continue;
    }
    if (seen.insert(normalized).second) {
      result.push_back(std::move(normalized));
    }
  }

  return result;
}

}  // namespace fitscore::core
