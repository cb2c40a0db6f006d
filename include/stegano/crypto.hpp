#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stegano::crypto {

using Bytes = std::vector<std::uint8_t>;

// Cyclic XOR; the same call encrypts and decrypts.
Bytes XorTransform(const Bytes& data, const std::string& key);

// AES-128 over independent 16-byte blocks. The key is zero-padded or
// truncated to 16 bytes and the plaintext is zero-padded to whole blocks
// (an empty plaintext becomes one block).
Bytes Aes128Encrypt(const std::string& key, const Bytes& plaintext);
Bytes Aes128Decrypt(const std::string& key, const Bytes& ciphertext);

Bytes PadKey(const std::string& key, std::size_t size);
Bytes PadToBlocks(const Bytes& data, std::size_t block_size);

}  // namespace stegano::crypto
