#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

#include "stegano/diagnostics.hpp"

namespace stegano::jpeg {

inline constexpr std::uint16_t kSoi = 0xFFD8;
inline constexpr std::uint16_t kEoi = 0xFFD9;
inline constexpr std::uint16_t kSos = 0xFFDA;
inline constexpr std::uint16_t kApp0 = 0xFFE0;
inline constexpr std::uint16_t kCom = 0xFFFE;
inline constexpr std::uint16_t kDqt = 0xFFDB;
inline constexpr std::uint16_t kDht = 0xFFC4;
inline constexpr std::uint16_t kSof0 = 0xFFC0;
inline constexpr std::uint16_t kSof1 = 0xFFC1;
inline constexpr std::uint16_t kSof2 = 0xFFC2;

struct MarkerSummary {
    std::uint64_t offset = 0;
    std::uint16_t marker = 0;
    std::string name;
    std::uint16_t length = 0;
    std::string detail;
};

const char* MarkerName(std::uint16_t marker);

// Read-only walk of the marker table. Requires SOI; stops at SOS, EOI,
// `max_markers` or the first short read (reported as a warning).
std::vector<MarkerSummary> InspectMarkers(std::istream& input, Diagnostics& diag, std::size_t max_markers = 64);

std::vector<MarkerSummary> InspectFile(const std::string& path, Diagnostics& diag, std::size_t max_markers = 64);

}  // namespace stegano::jpeg
