#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace songqueue::util {

/*
  UUID helpers

  Request and patron ids are RFC4122 v4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

inline std::string NewId() {
  return ToString(GenerateUUID());
}

} // namespace songqueue::util
