#include "fitscore/core/hashing.h"

#include <array>

namespace fitscore::core {

std::uint64_t stable_hash64(const std::string_view input, const std::uint64_t seed) {
  std::uint64_t hash = seed;
  for (const char ch : input) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kFnvPrime;
  }
  return hash;
}

std::uint64_t stable_hash64(const std::string_view input) {
  return stable_hash64(input, kFnvOffsetBasis);
}

std::string stable_hash64_hex(const std::string_view input) {
  constexpr std::array<char, 16> kDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                            '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::uint64_t hash = stable_hash64(input);
  std::string hex(16, '0');
  for (std::size_t i = hex.size(); i > 0; --i) {
    hex[i - 1] = kDigits[hash & 0xFu];
    hash >>= 4;
  }
  return hex;
}

}  // namespace fitscore::core
