#include "guactoken/config.hpp"

#include "guactoken/constants.hpp"

#include <cstdlib>

namespace guactoken::config {

namespace {

// Unset and empty variables both read as absent.
std::optional<std::string> FromEnv(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string Pick(const std::optional<std::string>& flag_value, std::string_view env_name, std::string_view fallback) {
    if (flag_value.has_value()) {
        return *flag_value;
    }
    return FromEnv(env_name).value_or(std::string(fallback));
}

// GUACTOKEN_NO_COLOR follows the NO_COLOR convention: any value turns colours
// off, except the explicit negatives below.
bool NoColorFromEnv() {
    auto value = FromEnv(constants::kEnvNoColor);
    if (!value.has_value()) {
        return false;
    }
    return *value != "0" && *value != "false" && *value != "no" && *value != "off";
}

}  // namespace

std::string ResolveSecretKey(const std::optional<std::string>& flag_value) {
    // An explicitly empty --key is kept so key validation can reject it.
    return Pick(flag_value, constants::kEnvSecretKey, constants::kDefaultSecretKey);
}

std::string ResolveFrontendUrl(const std::optional<std::string>& flag_value) {
    return Pick(flag_value, constants::kEnvFrontendUrl, constants::kDefaultFrontendUrl);
}

Settings Resolve(const std::optional<std::string>& key_flag,
                 const std::optional<std::string>& frontend_url_flag,
                 bool no_color_flag) {
    Settings settings;
    settings.secret_key = ResolveSecretKey(key_flag);
    settings.frontend_url = ResolveFrontendUrl(frontend_url_flag);
    settings.colors = !no_color_flag && !NoColorFromEnv();
    return settings;
}

}  // namespace guactoken::config
