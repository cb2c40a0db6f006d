#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace stegano::format {

using Bytes = std::vector<std::uint8_t>;

std::uint16_t ReadU16BE(const std::uint8_t* ptr);
std::uint32_t ReadU32BE(const std::uint8_t* ptr);
void PutU32BE(Bytes& out, std::uint32_t value);

// Lowercase hex without padding, e.g. "ae426082" or "3d008".
std::string Hex32(std::uint32_t value);
std::string HexBytes(const Bytes& data);

// 20 bytes per row: offset | hex bytes | printable ASCII.
void HexDump(const Bytes& data, std::uint64_t base_offset, std::ostream& os, bool colored = false);

}  // namespace stegano::format
