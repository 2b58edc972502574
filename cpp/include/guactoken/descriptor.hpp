#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "guactoken/constants.hpp"

namespace guactoken::descriptor {

// Keys keep insertion order so the serialized form follows the builder.
using Descriptor = nlohmann::ordered_json;

enum class Protocol { Rdp, Ssh, Vnc };

std::string_view ToString(Protocol protocol);
std::optional<Protocol> ProtocolFromString(std::string_view name);

// Empty strings count as "not supplied" throughout.
struct RdpOptions {
    std::string hostname;
    std::string username;
    std::string password;
    int width = constants::kDefaultWidth;
    int height = constants::kDefaultHeight;
    bool enable_drive = true;
    bool enable_recording = true;
    std::optional<std::int64_t> expiration;  // ms since epoch
};

struct SshOptions {
    std::string hostname;
    std::string username;
    std::string password;
    std::string private_key;
    bool enable_sftp = true;
    bool enable_recording = true;
    std::optional<std::int64_t> expiration;
};

struct VncOptions {
    std::string hostname;
    std::string password;
    int port = constants::kVncDefaultPort;
    bool enable_recording = true;
    std::optional<std::int64_t> expiration;
};

struct JoinOptions {
    std::string connection_id;
    bool read_only = false;
};

// Each builder validates its required fields first and throws
// guactoken::ValidationError naming every missing one.
Descriptor BuildRdp(const RdpOptions& options);
Descriptor BuildSsh(const SshOptions& options);
Descriptor BuildVnc(const VncOptions& options);
Descriptor BuildJoin(const JoinOptions& options);

std::int64_t NowMillis();
std::optional<std::int64_t> ExpirationOf(const Descriptor& descriptor);
bool IsExpired(const Descriptor& descriptor, std::int64_t now_ms);

// One-line description for diagnostics; passwords and keys are masked.
std::string Summarize(const Descriptor& descriptor);

}  // namespace guactoken::descriptor
