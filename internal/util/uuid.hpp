#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace flowstead::util {

/*
  UUID helpers

  Run ids, task ids and worker ids are RFC4122 v4 UUIDs in their
  canonical text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

// Deterministic 64-bit seed derived from an id (used for workflow-visible randomness).
uint64_t SeedFromId(const std::string& id);

} // namespace flowstead::util
