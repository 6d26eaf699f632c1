#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tasktree::util {

/*
  Stable, non-cryptographic content hashing (FNV-1a).

  Used for embedding-cache keys, chunk ids and feature hashing. Values
  are stable across processes and platforms.
*/

inline constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
inline constexpr std::uint64_t kFnvPrime  = 1099511628211ULL;

constexpr std::uint64_t Fnv1a64(std::string_view data, std::uint64_t seed = kFnvOffset) {
  std::uint64_t hash = seed;
  for (const char c : data) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
    hash *= kFnvPrime;
  }
  return hash;
}

// 16 lowercase hex chars.
std::string Fnv1a64Hex(std::string_view data);

// Content key: hash plus length, so equal-hash different-length inputs stay apart.
std::string ContentKey(std::string_view data);

} // namespace tasktree::util
