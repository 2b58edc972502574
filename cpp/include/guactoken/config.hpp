#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace guactoken::config {

// Settings a run of the tool needs beyond the descriptor itself.
// Each value comes from its command-line flag, then the environment, then a default.
struct Settings {
    std::string secret_key;
    std::string frontend_url;
    bool colors = true;
};

std::string ResolveSecretKey(const std::optional<std::string>& flag_value);
std::string ResolveFrontendUrl(const std::optional<std::string>& flag_value);
Settings Resolve(const std::optional<std::string>& key_flag,
                 const std::optional<std::string>& frontend_url_flag,
                 bool no_color_flag);

}  // namespace guactoken::config
