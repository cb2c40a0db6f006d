#pragma once

#include <string>
#include <string_view>

#include "stegano/crypto.hpp"

namespace stegano::cipher {

using Bytes = crypto::Bytes;

enum class Algorithm {
    Xor,
    Aes128,
    Unsupported,
};

// Case-insensitive: "xor", "aes", "aes128", "aes-128".
Algorithm ParseAlgorithm(std::string_view name);
const char* AlgorithmName(Algorithm algorithm);

// Throws ConfigError for Algorithm::Unsupported.
void Require(Algorithm algorithm);

Bytes Encrypt(Algorithm algorithm, const std::string& key, const Bytes& plaintext);
Bytes Decrypt(Algorithm algorithm, const std::string& key, const Bytes& ciphertext);

Bytes TrimZeroPadding(Bytes data);

}  // namespace stegano::cipher
