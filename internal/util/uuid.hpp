#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace tasktree::util {

/*
  UUID helpers

  Chunk ids are name-based: the same (task, position) always yields the
  same id, so re-indexing a task overwrites its points in place.
*/

using UUID = std::array<uint8_t, 16>;

// Deterministic RFC4122-shaped id derived from `name`.
UUID NameBasedUUID(std::string_view name);

std::string ToString(const UUID& id);

} // namespace tasktree::util
