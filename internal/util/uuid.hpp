#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace chunkscribe::util {

/*
  UUID helpers

  Chunk and event ids are RFC4122 v4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace chunkscribe::util
