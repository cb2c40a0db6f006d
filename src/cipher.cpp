#include "stegano/cipher.hpp"

#include "stegano/errors.hpp"

#include <cctype>

namespace stegano::cipher {

namespace {

std::string ToLower(std::string_view value) {
    std::string out(value);
    for (char& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

}  // namespace

Algorithm ParseAlgorithm(std::string_view name) {
    std::string lowered = ToLower(name);
    if (lowered == "xor") {
        return Algorithm::Xor;
    }
    if (lowered == "aes" || lowered == "aes128" || lowered == "aes-128") {
        return Algorithm::Aes128;
    }
    return Algorithm::Unsupported;
}

const char* AlgorithmName(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::Xor:
            return "xor";
        case Algorithm::Aes128:
            return "aes-128";
        case Algorithm::Unsupported:
            break;
    }
    return "unsupported";
}

void Require(Algorithm algorithm) {
    if (algorithm == Algorithm::Unsupported) {
        throw ConfigError("Unsupported encryption algorithm (expected xor or aes)");
    }
}

Bytes Encrypt(Algorithm algorithm, const std::string& key, const Bytes& plaintext) {
    Require(algorithm);
    if (algorithm == Algorithm::Aes128) {
        return crypto::Aes128Encrypt(key, plaintext);
    }
    return crypto::XorTransform(plaintext, key);
}

Bytes Decrypt(Algorithm algorithm, const std::string& key, const Bytes& ciphertext) {
    Require(algorithm);
    if (algorithm == Algorithm::Aes128) {
        return crypto::Aes128Decrypt(key, ciphertext);
    }
    return crypto::XorTransform(ciphertext, key);
}

Bytes TrimZeroPadding(Bytes data) {
    while (!data.empty() && data.back() == 0) {
        data.pop_back();
    }
    return data;
}

}  // namespace stegano::cipher
