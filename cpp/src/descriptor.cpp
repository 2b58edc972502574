#include "guactoken/descriptor.hpp"

#include "guactoken/errors.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace guactoken::descriptor {

namespace {

using Field = std::pair<std::string, Descriptor>;
using Fields = std::vector<Field>;

struct Requirement {
    std::string_view name;
    bool present;
};

void Require(std::string_view kind, std::initializer_list<Requirement> requirements) {
    std::string missing;
    for (const auto& req : requirements) {
        if (req.present) {
            continue;
        }
        if (!missing.empty()) {
            missing += ", ";
        }
        missing += req.name;
    }
    if (!missing.empty()) {
        throw ValidationError(std::string(kind) + " requires: " + missing);
    }
}

void RequirePositive(std::string_view kind, std::string_view name, int value) {
    if (value <= 0) {
        throw ValidationError(std::string(kind) + " " + std::string(name) + " must be positive, got "
                              + std::to_string(value));
    }
}

void AddRecording(Fields& fields, std::string_view path_key, std::string_view name_key) {
    fields.emplace_back(std::string(path_key), std::string(constants::kHistoryPlaceholder));
    fields.emplace_back(std::string(name_key), std::string(constants::kRecordingName));
}

void AddExpiration(Fields& fields, const std::optional<std::int64_t>& expiration) {
    if (expiration.has_value()) {
        fields.emplace_back(std::string(constants::kExpirationKey), expiration.value());
    }
}

Descriptor ToObject(Fields fields) {
    Descriptor settings = Descriptor::object();
    for (auto& field : fields) {
        settings[field.first] = std::move(field.second);
    }
    return settings;
}

Descriptor WrapConnection(std::string_view head_key, std::string_view head_value, Fields fields) {
    Descriptor connection = Descriptor::object();
    connection[std::string(head_key)] = std::string(head_value);
    connection[std::string(constants::kSettingsKey)] = ToObject(std::move(fields));
    Descriptor root = Descriptor::object();
    root[std::string(constants::kConnectionKey)] = std::move(connection);
    return root;
}

bool IsSecretKey(const std::string& key) {
    return key == "password" || key == "private-key";
}

}  // namespace

std::string_view ToString(Protocol protocol) {
    switch (protocol) {
        case Protocol::Rdp:
            return "rdp";
        case Protocol::Ssh:
            return "ssh";
        case Protocol::Vnc:
            return "vnc";
    }
    return "unknown";
}

std::optional<Protocol> ProtocolFromString(std::string_view name) {
    if (name == "rdp") {
        return Protocol::Rdp;
    }
    if (name == "ssh") {
        return Protocol::Ssh;
    }
    if (name == "vnc") {
        return Protocol::Vnc;
    }
    return std::nullopt;
}

Descriptor BuildRdp(const RdpOptions& options) {
    Require("rdp", {{"hostname", !options.hostname.empty()},
                    {"username", !options.username.empty()},
                    {"password", !options.password.empty()}});
    RequirePositive("rdp", "width", options.width);
    RequirePositive("rdp", "height", options.height);

    Fields fields;
    fields.emplace_back("hostname", options.hostname);
    fields.emplace_back("username", options.username);
    fields.emplace_back("password", options.password);
    fields.emplace_back("width", options.width);
    fields.emplace_back("height", options.height);
    fields.emplace_back("dpi", constants::kRdpDpi);
    fields.emplace_back("security", std::string(constants::kRdpSecurity));
    fields.emplace_back("ignore-cert", true);
    fields.emplace_back("enable-wallpaper", false);
    if (options.enable_drive) {
        fields.emplace_back("enable-drive", true);
        fields.emplace_back("drive-path", std::string(constants::kDrivePath));
        fields.emplace_back("create-drive-path", true);
    }
    if (options.enable_recording) {
        AddRecording(fields, "recording-path", "recording-name");
    }
    AddExpiration(fields, options.expiration);
    return WrapConnection(constants::kTypeKey, ToString(Protocol::Rdp), std::move(fields));
}

Descriptor BuildSsh(const SshOptions& options) {
    Require("ssh", {{"hostname", !options.hostname.empty()},
                    {"username", !options.username.empty()},
                    {"password or private key", !options.password.empty() || !options.private_key.empty()}});

    Fields fields;
    fields.emplace_back("hostname", options.hostname);
    fields.emplace_back("username", options.username);
    fields.emplace_back("port", constants::kSshPort);
    fields.emplace_back("font-size", constants::kSshFontSize);
    fields.emplace_back("color-scheme", std::string(constants::kSshColorScheme));
    fields.emplace_back("terminal-type", std::string(constants::kSshTerminalType));
    // Password wins when both credentials are supplied.
    if (!options.password.empty()) {
        fields.emplace_back("password", options.password);
    } else {
        fields.emplace_back("private-key", options.private_key);
    }
    if (options.enable_sftp) {
        fields.emplace_back("enable-sftp", true);
        fields.emplace_back("sftp-root-directory", std::string(constants::kSftpRootPrefix) + options.username);
    }
    if (options.enable_recording) {
        AddRecording(fields, "typescript-path", "typescript-name");
    }
    AddExpiration(fields, options.expiration);
    return WrapConnection(constants::kTypeKey, ToString(Protocol::Ssh), std::move(fields));
}

Descriptor BuildVnc(const VncOptions& options) {
    Require("vnc", {{"hostname", !options.hostname.empty()}});

    Fields fields;
    fields.emplace_back("hostname", options.hostname);
    fields.emplace_back("port", options.port);
    fields.emplace_back("color-depth", constants::kVncColorDepth);
    if (!options.password.empty()) {
        fields.emplace_back("password", options.password);
    }
    if (options.enable_recording) {
        AddRecording(fields, "recording-path", "recording-name");
    }
    AddExpiration(fields, options.expiration);
    return WrapConnection(constants::kTypeKey, ToString(Protocol::Vnc), std::move(fields));
}

Descriptor BuildJoin(const JoinOptions& options) {
    Require("join", {{"connection id", !options.connection_id.empty()}});

    Fields fields;
    fields.emplace_back("read-only", options.read_only);
    return WrapConnection(constants::kJoinKey, options.connection_id, std::move(fields));
}

std::int64_t NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::optional<std::int64_t> ExpirationOf(const Descriptor& descriptor) {
    auto connection = descriptor.find(std::string(constants::kConnectionKey));
    if (connection == descriptor.end() || !connection->is_object()) {
        return std::nullopt;
    }
    auto settings = connection->find(std::string(constants::kSettingsKey));
    if (settings == connection->end() || !settings->is_object()) {
        return std::nullopt;
    }
    auto expiration = settings->find(std::string(constants::kExpirationKey));
    if (expiration == settings->end() || !expiration->is_number()) {
        return std::nullopt;
    }
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    if (expiration->is_number_unsigned()) {
        // Beyond any representable instant: never expires.
        auto value = expiration->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(kMax)) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    }
    if (expiration->is_number_float()) {
        // floor keeps `value < now` intact against whole-millisecond clocks.
        double value = std::floor(expiration->get<double>());
        if (std::isnan(value) || value >= 9223372036854775808.0) {
            return std::nullopt;
        }
        if (value < -9223372036854775808.0) {
            return std::numeric_limits<std::int64_t>::min();
        }
        return static_cast<std::int64_t>(value);
    }
    return expiration->get<std::int64_t>();
}

bool IsExpired(const Descriptor& descriptor, std::int64_t now_ms) {
    auto expiration = ExpirationOf(descriptor);
    return expiration.has_value() && expiration.value() < now_ms;
}

std::string Summarize(const Descriptor& descriptor) {
    auto connection = descriptor.find(std::string(constants::kConnectionKey));
    if (connection == descriptor.end() || !connection->is_object()) {
        return "<not a connection descriptor>";
    }
    std::string out;
    if (auto type = connection->find(std::string(constants::kTypeKey)); type != connection->end() && type->is_string()) {
        out = type->get<std::string>();
    } else if (auto join = connection->find(std::string(constants::kJoinKey)); join != connection->end() && join->is_string()) {
        out = "join " + join->get<std::string>();
    } else {
        out = "<unknown>";
    }
    auto settings = connection->find(std::string(constants::kSettingsKey));
    if (settings == connection->end() || !settings->is_object()) {
        return out;
    }
    for (auto it = settings->begin(); it != settings->end(); ++it) {
        out += ' ';
        out += it.key();
        out += '=';
        if (IsSecretKey(it.key())) {
            out += "***";
        } else if (it.value().is_string()) {
            out += it.value().get<std::string>();
        } else {
            out += it.value().dump();
        }
    }
    return out;
}

}  // namespace guactoken::descriptor
