#include "hash.hpp"

namespace tasktree::util {

std::string Fnv1a64Hex(std::string_view data) {
  static constexpr char kHex[] = "0123456789abcdef";

  auto        hash = Fnv1a64(data);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

std::string ContentKey(std::string_view data) {
  return Fnv1a64Hex(data) + ":" + std::to_string(data.size());
}

} // namespace tasktree::util
