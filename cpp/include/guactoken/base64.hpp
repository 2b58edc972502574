#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace guactoken::base64 {

std::string Encode(const std::vector<std::uint8_t>& data);
std::string Encode(std::string_view text);

// Strict RFC 4648 decoding: the input length must be a multiple of four,
// '=' may only close the final quantum, and no other characters are accepted.
// On failure the result is empty and *ok (when given) is false.
std::vector<std::uint8_t> Decode(std::string_view input, bool* ok = nullptr);

bool IsBase64(std::string_view input);

}  // namespace guactoken::base64
