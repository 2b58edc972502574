#include "guactoken/base64.hpp"

#include <array>

namespace guactoken::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalid);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

std::string EncodeRaw(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(((size + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < size) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    if (i < size) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        if (i + 1 < size) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back(kEncTable[(triple >> 6) & 0x3F]);
            out.push_back('=');
        } else {
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back('=');
            out.push_back('=');
        }
    }
    return out;
}

std::size_t PaddingCount(std::string_view input) {
    std::size_t pad = 0;
    if (!input.empty() && input.back() == '=') {
        ++pad;
        if (input.size() >= 2 && input[input.size() - 2] == '=') {
            ++pad;
        }
    }
    return pad;
}

}  // namespace

std::string Encode(const std::vector<std::uint8_t>& data) {
    return EncodeRaw(data.data(), data.size());
}

std::string Encode(std::string_view text) {
    return EncodeRaw(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::vector<std::uint8_t> Decode(std::string_view input, bool* ok) {
    std::vector<std::uint8_t> out;
    if (ok) {
        *ok = false;
    }
    if (input.size() % 4 != 0) {
        return out;
    }
    const std::size_t pad = PaddingCount(input);
    const std::size_t data_len = input.size() - pad;
    out.reserve((input.size() / 4) * 3);

    std::uint32_t val = 0;
    int valb = -8;
    for (std::size_t i = 0; i < data_len; ++i) {
        std::uint8_t decoded = kDecTable[static_cast<unsigned char>(input[i])];
        if (decoded == kInvalid) {
            out.clear();
            return out;
        }
        val = ((val << 6) | decoded) & 0xFFFFFFu;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    // Bits left over after the last full byte must be zero, so every value
    // has exactly one accepted encoding.
    const int leftover = valb + 8;
    if (leftover > 0 && (val & ((1u << leftover) - 1u)) != 0) {
        out.clear();
        return out;
    }
    if (ok) {
        *ok = true;
    }
    return out;
}

bool IsBase64(std::string_view input) {
    bool ok = false;
    Decode(input, &ok);
    return ok;
}

}  // namespace guactoken::base64
