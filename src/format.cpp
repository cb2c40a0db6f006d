#include "stegano/format.hpp"

#include "stegano/cli_colors.hpp"

#include <algorithm>
#include <cstdio>

namespace stegano::format {

namespace {

constexpr std::size_t kHexDumpWidth = 20;
constexpr std::size_t kHexDumpGroup = 4;

}  // namespace

std::uint16_t ReadU16BE(const std::uint8_t* ptr) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(ptr[0]) << 8) | ptr[1]);
}

std::uint32_t ReadU32BE(const std::uint8_t* ptr) {
    return (static_cast<std::uint32_t>(ptr[0]) << 24)
           | (static_cast<std::uint32_t>(ptr[1]) << 16)
           | (static_cast<std::uint32_t>(ptr[2]) << 8)
           | static_cast<std::uint32_t>(ptr[3]);
}

void PutU32BE(Bytes& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

std::string Hex32(std::uint32_t value) {
    char buffer[9];
    std::snprintf(buffer, sizeof(buffer), "%x", static_cast<unsigned int>(value));
    return std::string(buffer);
}

std::string HexBytes(const Bytes& data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHex[(byte >> 4) & 0x0F]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

void HexDump(const Bytes& data, std::uint64_t base_offset, std::ostream& os, bool colored) {
    for (std::size_t row = 0; row < data.size(); row += kHexDumpWidth) {
        std::size_t row_len = std::min(kHexDumpWidth, data.size() - row);
        char address[24];
        std::snprintf(address, sizeof(address), "%08llu",
                      static_cast<unsigned long long>(base_offset + row));
        os << address << " | ";
        for (std::size_t j = 0; j < row_len; ++j) {
            char cell[4];
            std::snprintf(cell, sizeof(cell), "%02X ", data[row + j]);
            if (colored) {
                os << (j % 2 == 0 ? cli::color::BRIGHT_BLUE : cli::color::BRIGHT_GREEN) << cell
                   << cli::color::RESET;
            } else {
                os << cell;
            }
        }
        os << "| ";
        for (std::size_t j = 0; j < row_len; ++j) {
            std::uint8_t byte = data[row + j];
            os << ((byte > 0x20 && byte < 0x7F) ? static_cast<char>(byte) : '.');
            if ((j + 1) % kHexDumpGroup == 0 && j + 1 < row_len) {
                os << ' ';
            }
        }
        os << "\n";
    }
}

}  // namespace stegano::format
