#pragma once

#include <cstddef>

namespace stegano::env {

inline constexpr const char* kScanLimitVar = "STEGANO_SCAN_LIMIT";
inline constexpr const char* kNoColorVar = "NO_COLOR";
inline constexpr const char* kProjectNoColorVar = "STEGANO_NO_COLOR";

// Record walk limit. Unset, zero or malformed values give
// constants::kDefaultScanLimit; oversized values saturate.
std::size_t ScanLimit();

// True when NO_COLOR is set to anything non-empty, or STEGANO_NO_COLOR is
// one of 1/true/yes/on (any case).
bool ColorsDisabled();

}  // namespace stegano::env
