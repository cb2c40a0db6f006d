#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

#include "stegano/cipher.hpp"
#include "stegano/constants.hpp"
#include "stegano/diagnostics.hpp"
#include "stegano/locator.hpp"
#include "stegano/record.hpp"

namespace stegano::splice {

struct Options {
    locator::OffsetRequest offset;
    std::string key = std::string(constants::kDefaultKey);
    cipher::Algorithm algorithm = cipher::Algorithm::Xor;
    TypeTag type = constants::kSyntheticTypeTag;
    std::size_t scan_limit = constants::kDefaultScanLimit;
};

struct EncodeResult {
    std::uint64_t offset = 0;
    std::uint32_t record_size = 0;
    std::uint32_t checksum = 0;
    Bytes ciphertext;
};

struct DecodeResult {
    std::uint64_t offset = 0;
    std::uint32_t record_size = 0;
    std::uint32_t checksum = 0;
    bool checksum_ok = false;
    Bytes plaintext;
};

EncodeResult Encode(std::istream& input,
                    std::ostream& output,
                    const Bytes& payload,
                    const Options& options,
                    Diagnostics& diag);

DecodeResult Decode(std::istream& input,
                    std::ostream& output,
                    const Options& options,
                    Diagnostics& diag);

// Checks the signature before the output file is created and refuses to
// write over the input.
EncodeResult EncodeFile(const std::string& input_path,
                        const std::string& output_path,
                        const std::string& payload,
                        const Options& options,
                        Diagnostics& diag);

DecodeResult DecodeFile(const std::string& input_path,
                        const std::string& output_path,
                        const Options& options,
                        Diagnostics& diag);

}  // namespace stegano::splice
