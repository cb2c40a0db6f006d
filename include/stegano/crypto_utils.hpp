#pragma once

#include <openssl/evp.h>

#include <memory>

namespace stegano::crypto::detail {

struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

}  // namespace stegano::crypto::detail
