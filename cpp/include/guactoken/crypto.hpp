#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace guactoken::crypto {

using Bytes = std::vector<std::uint8_t>;

Bytes RandomBytes(std::size_t size);

// PKCS#7: always appends 1..block_size bytes, a full block when already aligned.
Bytes Pkcs7Pad(const Bytes& data, std::size_t block_size);
Bytes Pkcs7Unpad(const Bytes& data, std::size_t block_size);

// Raw AES-256-CBC over block-aligned input. OpenSSL padding is disabled;
// callers pad and unpad with the functions above.
Bytes AesCbcEncrypt(const Bytes& key, const Bytes& iv, const Bytes& plaintext);
Bytes AesCbcDecrypt(const Bytes& key, const Bytes& iv, const Bytes& ciphertext);

}  // namespace guactoken::crypto
