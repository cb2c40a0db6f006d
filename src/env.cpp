#include "stegano/env.hpp"

#include "stegano/constants.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace stegano::env {

namespace {

std::string Read(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool IsTruthy(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // namespace

std::size_t ScanLimit() {
    std::string raw = Read(kScanLimitVar);
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        return constants::kDefaultScanLimit;
    }
    std::uint64_t parsed = 0;
    try {
        parsed = static_cast<std::uint64_t>(std::stoull(raw));
    } catch (const std::out_of_range&) {
        return std::numeric_limits<std::size_t>::max();
    }
    if (parsed == 0) {
        return constants::kDefaultScanLimit;
    }
    if (parsed > std::numeric_limits<std::size_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(parsed);
}

bool ColorsDisabled() {
    return !Read(kNoColorVar).empty() || IsTruthy(Read(kProjectNoColorVar));
}

}  // namespace stegano::env
