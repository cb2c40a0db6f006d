#pragma once

#include <cstdint>

#include "stegano/record.hpp"

namespace stegano::checksum {

// CRC-32 over tag then payload, continuing from `seed`.
std::uint32_t Compute(std::uint32_t seed, const TypeTag& type, const Bytes& payload);

// Stored checksum against the standard (seed 0) value.
bool Verify(const Record& record);

}  // namespace stegano::checksum
