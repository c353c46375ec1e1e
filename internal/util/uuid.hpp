#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace bridge::util {

/*
  UUID helpers

  Payload references handed out by the payload store are RFC4122 v4 UUIDs
  in their canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace bridge::util
