#pragma once

#include <openssl/evp.h>

#include <memory>

namespace guactoken::crypto::detail {

// RAII wrapper so every exit path releases the OpenSSL cipher context
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;

inline UniqueCipherCtx NewCipherCtx() {
    return UniqueCipherCtx(EVP_CIPHER_CTX_new());
}

}  // namespace guactoken::crypto::detail
