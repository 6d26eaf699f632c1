#include "uuid.hpp"

#include <iomanip>
#include <sstream>

#include "internal/util/hash.hpp"

namespace tasktree::util {

namespace {

// Second lane seed for the upper 64 bits.
constexpr std::uint64_t kHighLaneSeed = 0x9e3779b97f4a7c15ULL;

void StampVersion(UUID& id, uint8_t version) {
  id[6] = static_cast<uint8_t>((id[6] & 0x0F) | (version << 4));
  id[8] = static_cast<uint8_t>((id[8] & 0x3F) | 0x80);
}

} // namespace

UUID NameBasedUUID(std::string_view name) {
  const auto low  = Fnv1a64(name);
  const auto high = Fnv1a64(name, kHighLaneSeed ^ low);

  UUID id{};
  for (size_t i = 0; i < 8; ++i) {
    id[i]     = static_cast<uint8_t>(high >> (56 - 8 * i));
    id[i + 8] = static_cast<uint8_t>(low >> (56 - 8 * i));
  }

  StampVersion(id, 5);
  return id;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
  }
  return oss.str();
}

} // namespace tasktree::util
