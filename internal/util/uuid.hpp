#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace saga::util {

/*
  UUID helpers

  Saga ids are RFC4122 version 4 UUIDs in canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Shorthand for ToString(GenerateUUID()).
std::string NewSagaId();

} // namespace saga::util
