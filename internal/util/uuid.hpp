#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace commute::util {

/*
  UUID helpers

  Batch identifiers are random RFC4122 version 4 UUIDs.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace commute::util
