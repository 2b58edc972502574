#pragma once

#include <string>
#include <string_view>

namespace guactoken::url {

// Percent-encodes everything except RFC 3986 unreserved characters and
// the characters listed in `safe`.
std::string PercentEncode(std::string_view input, std::string_view safe = "/");

// <frontend_url>/?token=<percent-encoded token>
std::string BuildConnectUrl(std::string_view frontend_url, std::string_view token);

}  // namespace guactoken::url
