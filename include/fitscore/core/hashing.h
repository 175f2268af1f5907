#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace fitscore::core {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

// FNV-1a 64-bit. Stable across platforms and runs; not cryptographic.
// Used for embedding cache keys and for feature hashing in the stub encoder.
std::uint64_t stable_hash64(std::string_view input);

// Seeded variant: the seed replaces the offset basis, giving independent hash
// functions over the same input (stable_hash64(s, kFnvOffsetBasis) == stable_hash64(s)).
std::uint64_t stable_hash64(std::string_view input, std::uint64_t seed);

// 16 lowercase hex digits, zero-padded.
std::string stable_hash64_hex(std::string_view input);

}  // namespace fitscore::core
