#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace guactoken::constants {

inline constexpr std::size_t kSecretKeyLen = 32;
inline constexpr std::size_t kIvLen = 16;
inline constexpr std::size_t kBlockSize = 16;

inline constexpr std::string_view kDefaultSecretKey = "MySuperSecretKeyForParamsToken12";
inline constexpr std::string_view kDefaultFrontendUrl = "http://localhost:3000";

inline constexpr std::string_view kEnvSecretKey = "GUACTOKEN_SECRET_KEY";
inline constexpr std::string_view kEnvFrontendUrl = "GUACTOKEN_FRONTEND_URL";
inline constexpr std::string_view kEnvNoColor = "GUACTOKEN_NO_COLOR";

// Envelope field names expected by the gateway.
inline constexpr std::string_view kEnvelopeIv = "iv";
inline constexpr std::string_view kEnvelopeValue = "value";

inline constexpr std::string_view kConnectionKey = "connection";
inline constexpr std::string_view kTypeKey = "type";
inline constexpr std::string_view kJoinKey = "join";
inline constexpr std::string_view kSettingsKey = "settings";
inline constexpr std::string_view kExpirationKey = "expiration";

// Substituted by the gateway when the session starts.
inline constexpr std::string_view kHistoryPlaceholder = "${HISTORY_UUID}";
inline constexpr std::string_view kRecordingName = "session";
inline constexpr std::string_view kDrivePath = "/tmp/guac-drive";
inline constexpr std::string_view kSftpRootPrefix = "/home/";

inline constexpr int kDefaultWidth = 1920;
inline constexpr int kDefaultHeight = 1080;
inline constexpr int kRdpDpi = 96;
inline constexpr std::string_view kRdpSecurity = "any";

inline constexpr int kSshPort = 22;
inline constexpr int kSshFontSize = 12;
inline constexpr std::string_view kSshColorScheme = "gray-black";
inline constexpr std::string_view kSshTerminalType = "xterm-256color";

inline constexpr int kVncDefaultPort = 5900;
inline constexpr int kVncColorDepth = 24;

}  // namespace guactoken::constants
