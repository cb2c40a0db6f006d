#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace stegano::constants {

inline constexpr std::string_view kVersion = "0.4.1";

inline constexpr std::size_t kSignatureSize = 8;
inline constexpr std::array<std::uint8_t, kSignatureSize> kPngSignature = {
    0x89u, 0x50u, 0x4Eu, 0x47u, 0x0Du, 0x0Au, 0x1Au, 0x0Au
};
// Bytes 1..3 of the signature; the only part the guard insists on.
inline constexpr std::string_view kSignatureTag = "PNG";

inline constexpr std::size_t kLengthFieldSize = 4;
inline constexpr std::size_t kTypeTagSize = 4;
inline constexpr std::size_t kChecksumSize = 4;
inline constexpr std::size_t kRecordFramingSize = kLengthFieldSize + kTypeTagSize + kChecksumSize;

inline constexpr std::string_view kTerminalLabel = "IEND";

// Synthetic record: [len:1][tag:4][payload][crc:4].
inline constexpr std::size_t kSyntheticLengthSize = 1;
inline constexpr std::size_t kSyntheticFramingSize = kSyntheticLengthSize + kTypeTagSize + kChecksumSize;
inline constexpr std::size_t kMaxSyntheticPayload = 255;
inline constexpr std::array<std::uint8_t, kTypeTagSize> kSyntheticTypeTag = {'s', 't', 'E', 'g'};

// Auto offsets land one full record frame, less the synthetic length byte,
// before the terminal record.
inline constexpr std::uint64_t kAutoOffsetBackoff = kRecordFramingSize - kSyntheticLengthSize;
// Both pipelines copy `offset - kPrefixBackoff` bytes after writing the signature.
inline constexpr std::uint64_t kPrefixBackoff = kSignatureSize;

inline constexpr std::uint32_t kStandardChecksumSeed = 0;

inline constexpr std::size_t kCopyBufferSize = 65536;
inline constexpr std::size_t kAesBlockSize = 16;

// Overridden by STEGANO_SCAN_LIMIT, see env::ScanLimit().
inline constexpr std::size_t kDefaultScanLimit = 1u << 20;

inline constexpr std::string_view kDefaultOutput = "output.png";
inline constexpr std::string_view kDefaultKey = "key";
inline constexpr std::string_view kDefaultPayload = "hello";
inline constexpr std::string_view kDefaultAlgorithm = "xor";

}  // namespace stegano::constants
