#include "guactoken/crypto.hpp"

#include "guactoken/constants.hpp"
#include "guactoken/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace guactoken::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

void CheckCbcInputs(const Bytes& key, const Bytes& iv, const Bytes& data) {
    if (key.size() != constants::kSecretKeyLen) {
        throw std::runtime_error("AES-CBC expects " + std::to_string(constants::kSecretKeyLen) + "-byte key");
    }
    if (iv.size() != constants::kIvLen) {
        throw std::runtime_error("AES-CBC expects " + std::to_string(constants::kIvLen) + "-byte IV");
    }
    if (data.size() % constants::kBlockSize != 0) {
        throw std::runtime_error("AES-CBC input is not a multiple of the block size");
    }
    if (data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("AES-CBC input too large");
    }
}

enum class Direction { Encrypt, Decrypt };

Bytes CbcTransform(Direction direction, const Bytes& key, const Bytes& iv, const Bytes& data) {
    CheckCbcInputs(key, iv, data);
    const bool encrypt = direction == Direction::Encrypt;

    detail::UniqueCipherCtx ctx = detail::NewCipherCtx();
    if (!ctx) {
        throw std::runtime_error("AES-CBC context allocation failed");
    }
    Ensure(EVP_CipherInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data(), encrypt ? 1 : 0) == 1,
           "AES-CBC init failed");
    Ensure(EVP_CIPHER_CTX_set_padding(ctx.get(), 0) == 1, "AES-CBC disable padding failed");

    Bytes out(data.size() + constants::kBlockSize);
    int out_len = 0;
    int total_len = 0;
    if (!data.empty()) {
        Ensure(EVP_CipherUpdate(ctx.get(), out.data(), &out_len, data.data(), static_cast<int>(data.size())) == 1,
               encrypt ? "AES-CBC encrypt failed" : "AES-CBC decrypt failed");
        total_len += out_len;
    }
    Ensure(EVP_CipherFinal_ex(ctx.get(), out.data() + total_len, &out_len) == 1, "AES-CBC final failed");
    total_len += out_len;
    out.resize(static_cast<std::size_t>(total_len));
    return out;
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Pkcs7Pad(const Bytes& data, std::size_t block_size) {
    if (block_size == 0 || block_size > 255) {
        throw std::runtime_error("PKCS#7 block size must be in 1..255");
    }
    const std::size_t pad_len = block_size - (data.size() % block_size);
    Bytes out;
    out.reserve(data.size() + pad_len);
    out.insert(out.end(), data.begin(), data.end());
    out.insert(out.end(), pad_len, static_cast<std::uint8_t>(pad_len));
    return out;
}

Bytes Pkcs7Unpad(const Bytes& data, std::size_t block_size) {
    if (block_size == 0 || block_size > 255) {
        throw std::runtime_error("PKCS#7 block size must be in 1..255");
    }
    if (data.empty() || data.size() % block_size != 0) {
        throw std::runtime_error("PKCS#7 input is not a whole number of blocks");
    }
    const std::size_t pad_len = data.back();
    if (pad_len == 0 || pad_len > block_size || pad_len > data.size()) {
        throw std::runtime_error("Invalid PKCS#7 padding length");
    }
    for (std::size_t i = data.size() - pad_len; i < data.size(); ++i) {
        if (data[i] != pad_len) {
            throw std::runtime_error("Invalid PKCS#7 padding bytes");
        }
    }
    return Bytes(data.begin(), data.end() - static_cast<std::ptrdiff_t>(pad_len));
}

Bytes AesCbcEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext) {
    return CbcTransform(Direction::Encrypt, key, iv, plaintext);
}

Bytes AesCbcDecrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext) {
    return CbcTransform(Direction::Decrypt, key, iv, ciphertext);
}

}  // namespace guactoken::crypto
