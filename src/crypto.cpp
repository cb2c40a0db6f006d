#include "stegano/crypto.hpp"

#include "stegano/constants.hpp"
#include "stegano/crypto_utils.hpp"
#include "stegano/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace stegano::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

Bytes AesEcbTransform(const std::string& key, const Bytes& data, bool encrypt) {
    Bytes key_bytes = PadKey(key, constants::kAesBlockSize);
    detail::UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("AES-128 context allocation failed");
    }
    Bytes out(data.size() + constants::kAesBlockSize);
    int out_len = 0;
    int total_len = 0;

    Ensure(EVP_CipherInit_ex(ctx.get(), EVP_aes_128_ecb(), nullptr, key_bytes.data(), nullptr,
                             encrypt ? 1 : 0) == 1,
           "AES-128 init failed");
    // Blocks are zero-padded by the caller
    Ensure(EVP_CIPHER_CTX_set_padding(ctx.get(), 0) == 1, "AES-128 set padding failed");
    if (!data.empty()) {
        Ensure(EVP_CipherUpdate(ctx.get(), out.data(), &out_len, data.data(), static_cast<int>(data.size())) == 1,
               "AES-128 update failed");
        total_len += out_len;
    }
    Ensure(EVP_CipherFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-128 final failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

}  // namespace

Bytes XorTransform(const Bytes& data, const std::string& key) {
    if (key.empty()) {
        throw ConfigError("XOR key must not be empty");
    }
    Bytes out(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        out[i] = static_cast<std::uint8_t>(data[i] ^ static_cast<std::uint8_t>(key[i % key.size()]));
    }
    return out;
}

Bytes PadKey(const std::string& key, std::size_t size) {
    Bytes out(size, 0);
    std::copy_n(key.begin(), std::min(key.size(), size), out.begin());
    return out;
}

Bytes PadToBlocks(const Bytes& data, std::size_t block_size) {
    std::size_t blocks = data.empty() ? 1 : (data.size() + block_size - 1) / block_size;
    Bytes out(blocks * block_size, 0);
    std::copy(data.begin(), data.end(), out.begin());
    return out;
}

Bytes Aes128Encrypt(const std::string& key, const Bytes& plaintext) {
    return AesEcbTransform(key, PadToBlocks(plaintext, constants::kAesBlockSize), true);
}

Bytes Aes128Decrypt(const std::string& key, const Bytes& ciphertext) {
    if (ciphertext.empty() || ciphertext.size() % constants::kAesBlockSize != 0) {
        // Usually a record embedded with another algorithm.
        throw ConfigError("AES-128 ciphertext must be a whole number of 16-byte blocks, got "
                          + std::to_string(ciphertext.size()) + " bytes");
    }
    return AesEcbTransform(key, ciphertext, false);
}

}  // namespace stegano::crypto
