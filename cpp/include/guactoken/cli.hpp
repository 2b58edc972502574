#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "guactoken/constants.hpp"
#include "guactoken/descriptor.hpp"

namespace guactoken::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitExpired = 3;

// Malformed command line; reported together with the usage text.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

struct CommonArgs {
    std::optional<std::string> key;
    std::optional<std::string> frontend_url;
    bool no_color = false;
    bool verbose = false;
};

struct EncodeArgs {
    CommonArgs common;
    std::string protocol;
    std::string join;
    std::string host;
    std::string user;
    std::string password;
    std::string private_key;
    std::optional<int> port;
    int width = constants::kDefaultWidth;
    int height = constants::kDefaultHeight;
    bool enable_drive = true;
    bool enable_sftp = true;
    bool enable_recording = true;
    bool read_only = false;
    bool output_url = false;
    std::optional<std::int64_t> expires_in;  // seconds
};

struct DecodeArgs {
    CommonArgs common;
    std::string token;
    bool allow_expired = false;
};

void PrintUsage(std::ostream& out);

// Arguments after the subcommand name.
EncodeArgs ParseEncodeArgs(const std::vector<std::string>& args);
DecodeArgs ParseDecodeArgs(const std::vector<std::string>& args);

descriptor::Descriptor BuildDescriptor(const EncodeArgs& opts);

// Results go to `out`; diagnostics always go to stderr.
int RunEncode(const EncodeArgs& opts, std::ostream& out);
int RunDecode(const DecodeArgs& opts, std::ostream& out);

// Full command line without the program name. Never throws; every failure
// is reported on stderr and mapped to an exit code.
int Run(const std::vector<std::string>& args, std::ostream& out = std::cout);

}  // namespace guactoken::cli
