#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guactoken/descriptor.hpp"

namespace guactoken::token {

using Bytes = std::vector<std::uint8_t>;

// The intermediate {"iv", "value"} structure; both fields hold base64 text.
struct Envelope {
    std::string iv;
    std::string value;
};

// Returns the raw key bytes or throws guactoken::ConfigError.
Bytes ValidateSecretKey(std::string_view secret_key);

// base64(json({"iv": base64(iv), "value": base64(AES-256-CBC(pkcs7(json(descriptor))))}))
// A fresh random IV is drawn on every call.
std::string Encrypt(const descriptor::Descriptor& descriptor, std::string_view secret_key);

// Inverse of Encrypt. Throws ConfigError for an unusable key and
// DecodeError for anything wrong with the token itself.
descriptor::Descriptor Decrypt(std::string_view token, std::string_view secret_key);

std::string SerializeEnvelope(const Envelope& envelope);
Envelope ParseEnvelope(std::string_view token);

}  // namespace guactoken::token
