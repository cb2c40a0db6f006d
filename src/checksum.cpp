#include "stegano/checksum.hpp"

#include <zlib.h>

namespace stegano::checksum {

std::uint32_t Compute(std::uint32_t seed, const TypeTag& type, const Bytes& payload) {
    uLong crc = crc32(static_cast<uLong>(seed), type.data(), static_cast<uInt>(type.size()));
    if (!payload.empty()) {
        crc = crc32(crc, payload.data(), static_cast<uInt>(payload.size()));
    }
    return static_cast<std::uint32_t>(crc);
}

bool Verify(const Record& record) {
    if (record.payload.size() != record.length) {
        return false;
    }
    return Compute(constants::kStandardChecksumSeed, record.type, record.payload) == record.checksum;
}

}  // namespace stegano::checksum
