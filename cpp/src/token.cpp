#include "guactoken/token.hpp"

#include "guactoken/base64.hpp"
#include "guactoken/constants.hpp"
#include "guactoken/crypto.hpp"
#include "guactoken/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace guactoken::token {

namespace {

using Json = nlohmann::ordered_json;

Bytes ToBytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

Bytes DecodeField(const std::string& encoded, const char* name) {
    bool ok = false;
    Bytes raw = base64::Decode(encoded, &ok);
    if (!ok) {
        throw DecodeError(std::string("envelope field '") + name + "' is not valid base64");
    }
    return raw;
}

std::string StringField(const Json& root, std::string_view name) {
    auto it = root.find(std::string(name));
    if (it == root.end()) {
        throw DecodeError("envelope is missing field '" + std::string(name) + "'");
    }
    if (!it->is_string()) {
        throw DecodeError("envelope field '" + std::string(name) + "' is not a string");
    }
    return it->get<std::string>();
}

}  // namespace

Bytes ValidateSecretKey(std::string_view secret_key) {
    if (secret_key.size() != constants::kSecretKeyLen) {
        throw ConfigError("secret key must be exactly " + std::to_string(constants::kSecretKeyLen)
                          + " bytes, got " + std::to_string(secret_key.size()));
    }
    return ToBytes(secret_key);
}

std::string SerializeEnvelope(const Envelope& envelope) {
    Json root = Json::object();
    root[std::string(constants::kEnvelopeIv)] = envelope.iv;
    root[std::string(constants::kEnvelopeValue)] = envelope.value;
    return base64::Encode(root.dump());
}

Envelope ParseEnvelope(std::string_view token) {
    bool ok = false;
    Bytes outer = base64::Decode(token, &ok);
    if (!ok || outer.empty()) {
        throw DecodeError("token is not valid base64");
    }
    // JSON text never carries NUL; the parser would stop at one and accept the prefix.
    if (std::find(outer.begin(), outer.end(), std::uint8_t{0}) != outer.end()) {
        throw DecodeError("token envelope contains a NUL byte");
    }
    Json root = Json::parse(outer.begin(), outer.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw DecodeError("token envelope is not a JSON object");
    }
    Envelope envelope;
    envelope.iv = StringField(root, constants::kEnvelopeIv);
    envelope.value = StringField(root, constants::kEnvelopeValue);
    return envelope;
}

std::string Encrypt(const descriptor::Descriptor& descriptor, std::string_view secret_key) {
    Bytes key = ValidateSecretKey(secret_key);

    std::string plaintext;
    try {
        plaintext = descriptor.dump();
    } catch (const nlohmann::json::exception& exc) {
        throw ValidationError(std::string("descriptor cannot be serialized: ") + exc.what());
    }

    Bytes iv = crypto::RandomBytes(constants::kIvLen);
    Bytes padded = crypto::Pkcs7Pad(ToBytes(plaintext), constants::kBlockSize);
    Bytes ciphertext = crypto::AesCbcEncrypt(key, iv, padded);

    Envelope envelope;
    envelope.iv = base64::Encode(iv);
    envelope.value = base64::Encode(ciphertext);
    return SerializeEnvelope(envelope);
}

descriptor::Descriptor Decrypt(std::string_view token, std::string_view secret_key) {
    Bytes key = ValidateSecretKey(secret_key);
    Envelope envelope = ParseEnvelope(token);

    Bytes iv = DecodeField(envelope.iv, "iv");
    if (iv.size() != constants::kIvLen) {
        throw DecodeError("IV must be " + std::to_string(constants::kIvLen) + " bytes, got "
                          + std::to_string(iv.size()));
    }
    Bytes ciphertext = DecodeField(envelope.value, "value");
    if (ciphertext.empty() || ciphertext.size() % constants::kBlockSize != 0) {
        throw DecodeError("ciphertext length " + std::to_string(ciphertext.size())
                          + " is not a positive multiple of the block size");
    }

    Bytes plaintext;
    try {
        Bytes padded = crypto::AesCbcDecrypt(key, iv, ciphertext);
        plaintext = crypto::Pkcs7Unpad(padded, constants::kBlockSize);
    } catch (const std::runtime_error& exc) {
        throw DecodeError(std::string("token decryption failed: ") + exc.what());
    }

    descriptor::Descriptor result = descriptor::Descriptor::parse(plaintext.begin(), plaintext.end(), nullptr, false);
    if (result.is_discarded() || !result.is_object()) {
        throw DecodeError("decrypted payload is not a JSON object");
    }
    return result;
}

}  // namespace guactoken::token
