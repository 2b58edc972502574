#include "guactoken/url.hpp"

namespace guactoken::url {

namespace {

constexpr char kHexDigits[] = "0123456789ABCDEF";

bool IsUnreserved(unsigned char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
           || ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

}  // namespace

std::string PercentEncode(std::string_view input, std::string_view safe) {
    std::string out;
    out.reserve(input.size() * 3);
    for (char raw : input) {
        unsigned char ch = static_cast<unsigned char>(raw);
        if (IsUnreserved(ch) || safe.find(raw) != std::string_view::npos) {
            out.push_back(raw);
            continue;
        }
        out.push_back('%');
        out.push_back(kHexDigits[(ch >> 4) & 0x0F]);
        out.push_back(kHexDigits[ch & 0x0F]);
    }
    return out;
}

std::string BuildConnectUrl(std::string_view frontend_url, std::string_view token) {
    std::string out(frontend_url);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    out += "/?token=";
    out += PercentEncode(token);
    return out;
}

}  // namespace guactoken::url
