#include "guactoken/cli.hpp"

#include "guactoken/cli_colors.hpp"
#include "guactoken/config.hpp"
#include "guactoken/errors.hpp"
#include "guactoken/token.hpp"
#include "guactoken/url.hpp"

#include <limits>

namespace guactoken::cli {

namespace {

class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool Done() const { return idx_ >= args_.size(); }
    const std::string& Next() { return args_[idx_++]; }

    const std::string& Value(const std::string& flag) {
        if (idx_ >= args_.size()) {
            throw UsageError("Missing value for " + flag);
        }
        return args_[idx_++];
    }

    std::int64_t IntValue(const std::string& flag) {
        const std::string& raw = Value(flag);
        try {
            std::size_t consumed = 0;
            long long parsed = std::stoll(raw, &consumed);
            if (consumed != raw.size()) {
                throw UsageError("Invalid number for " + flag + ": " + raw);
            }
            return static_cast<std::int64_t>(parsed);
        } catch (const std::invalid_argument&) {
            throw UsageError("Invalid number for " + flag + ": " + raw);
        } catch (const std::out_of_range&) {
            throw UsageError("Number out of range for " + flag + ": " + raw);
        }
    }

private:
    const std::vector<std::string>& args_;
    std::size_t idx_ = 0;
};

int ToInt(std::int64_t value, const std::string& flag) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw UsageError("Number out of range for " + flag);
    }
    return static_cast<int>(value);
}

bool ParseCommonFlag(const std::string& flag, ArgCursor& cursor, CommonArgs& common) {
    if (flag == "--key") {
        common.key = cursor.Value(flag);
    } else if (flag == "--frontend-url") {
        common.frontend_url = cursor.Value(flag);
    } else if (flag == "--no-color") {
        common.no_color = true;
    } else if (flag == "--verbose" || flag == "-v") {
        common.verbose = true;
    } else {
        return false;
    }
    return true;
}

config::Settings ApplyCommon(const CommonArgs& common) {
    config::Settings settings = config::Resolve(common.key, common.frontend_url, common.no_color);
    if (!settings.colors) {
        SetColorsEnabled(false);
    }
    return settings;
}

std::optional<std::int64_t> ExpirationFrom(const EncodeArgs& opts) {
    if (!opts.expires_in.has_value()) {
        return std::nullopt;
    }
    return descriptor::NowMillis() + opts.expires_in.value() * 1000;
}

}  // namespace

void PrintUsage(std::ostream& out) {
    out << "Usage:\n";
    out << "  guactoken_cpp encode --protocol rdp --host <host> --user <user> --password <pw> [--width <n>] [--height <n>] [--no-drive] [--no-recording]\n";
    out << "  guactoken_cpp encode --protocol ssh --host <host> --user <user> (--password <pw> | --private-key <pem>) [--no-sftp] [--no-recording]\n";
    out << "  guactoken_cpp encode --protocol vnc --host <host> [--password <pw>] [--port <n>] [--no-recording]\n";
    out << "  guactoken_cpp encode --join <connection-id> [--read-only]\n";
    out << "  guactoken_cpp decode <token> [--allow-expired]\n";
    out << "\n";
    out << "Common options:\n";
    out << "  --key <key>            32-character secret key (env GUACTOKEN_SECRET_KEY)\n";
    out << "  --expires-in <sec>     reject the connection after this many seconds\n";
    out << "  --output-url           print <frontend-url>/?token=... instead of the token\n";
    out << "  --frontend-url <url>   base URL for --output-url (env GUACTOKEN_FRONTEND_URL)\n";
    out << "  --verbose              describe the descriptor on stderr\n";
    out << "  --no-color             disable colored diagnostics (env GUACTOKEN_NO_COLOR)\n";
}

EncodeArgs ParseEncodeArgs(const std::vector<std::string>& args) {
    EncodeArgs opts;
    ArgCursor cursor(args);
    while (!cursor.Done()) {
        const std::string& flag = cursor.Next();
        if (ParseCommonFlag(flag, cursor, opts.common)) {
            continue;
        }
        if (flag == "--protocol") {
            opts.protocol = cursor.Value(flag);
        } else if (flag == "--join") {
            opts.join = cursor.Value(flag);
        } else if (flag == "--host") {
            opts.host = cursor.Value(flag);
        } else if (flag == "--user") {
            opts.user = cursor.Value(flag);
        } else if (flag == "--password") {
            opts.password = cursor.Value(flag);
        } else if (flag == "--private-key") {
            opts.private_key = cursor.Value(flag);
        } else if (flag == "--port") {
            opts.port = ToInt(cursor.IntValue(flag), flag);
        } else if (flag == "--width") {
            opts.width = ToInt(cursor.IntValue(flag), flag);
        } else if (flag == "--height") {
            opts.height = ToInt(cursor.IntValue(flag), flag);
        } else if (flag == "--enable-drive") {
            opts.enable_drive = true;
        } else if (flag == "--no-drive") {
            opts.enable_drive = false;
        } else if (flag == "--enable-sftp") {
            opts.enable_sftp = true;
        } else if (flag == "--no-sftp") {
            opts.enable_sftp = false;
        } else if (flag == "--enable-recording") {
            opts.enable_recording = true;
        } else if (flag == "--no-recording") {
            opts.enable_recording = false;
        } else if (flag == "--read-only") {
            opts.read_only = true;
        } else if (flag == "--output-url") {
            opts.output_url = true;
        } else if (flag == "--expires-in") {
            std::int64_t seconds = cursor.IntValue(flag);
            if (seconds <= 0 || seconds > (std::numeric_limits<std::int64_t>::max() - descriptor::NowMillis()) / 1000) {
                throw UsageError("--expires-in must be a positive number of seconds");
            }
            opts.expires_in = seconds;
        } else {
            throw UsageError("Unknown flag: " + flag);
        }
    }
    return opts;
}

DecodeArgs ParseDecodeArgs(const std::vector<std::string>& args) {
    DecodeArgs opts;
    ArgCursor cursor(args);
    while (!cursor.Done()) {
        const std::string& arg = cursor.Next();
        if (ParseCommonFlag(arg, cursor, opts.common)) {
            continue;
        }
        if (arg == "--allow-expired") {
            opts.allow_expired = true;
        } else if (arg.rfind("--", 0) == 0) {
            throw UsageError("Unknown flag: " + arg);
        } else if (opts.token.empty()) {
            opts.token = arg;
        } else {
            throw UsageError("Unexpected argument: " + arg);
        }
    }
    if (opts.token.empty()) {
        throw UsageError("Missing token");
    }
    return opts;
}

descriptor::Descriptor BuildDescriptor(const EncodeArgs& opts) {
    if (!opts.join.empty()) {
        if (opts.expires_in.has_value()) {
            PrintWarning("--expires-in is ignored for --join");
        }
        descriptor::JoinOptions join;
        join.connection_id = opts.join;
        join.read_only = opts.read_only;
        return descriptor::BuildJoin(join);
    }
    if (opts.protocol.empty()) {
        throw UsageError("Must specify either --protocol or --join");
    }
    auto protocol = descriptor::ProtocolFromString(opts.protocol);
    if (!protocol.has_value()) {
        throw UsageError("Unknown protocol: " + opts.protocol + " (expected rdp, ssh or vnc)");
    }
    if (opts.port.has_value() && protocol.value() != descriptor::Protocol::Vnc) {
        PrintWarning("--port only applies to vnc and is ignored");
    }

    switch (protocol.value()) {
        case descriptor::Protocol::Rdp: {
            descriptor::RdpOptions rdp;
            rdp.hostname = opts.host;
            rdp.username = opts.user;
            rdp.password = opts.password;
            rdp.width = opts.width;
            rdp.height = opts.height;
            rdp.enable_drive = opts.enable_drive;
            rdp.enable_recording = opts.enable_recording;
            rdp.expiration = ExpirationFrom(opts);
            return descriptor::BuildRdp(rdp);
        }
        case descriptor::Protocol::Ssh: {
            descriptor::SshOptions ssh;
            ssh.hostname = opts.host;
            ssh.username = opts.user;
            ssh.password = opts.password;
            ssh.private_key = opts.private_key;
            ssh.enable_sftp = opts.enable_sftp;
            ssh.enable_recording = opts.enable_recording;
            ssh.expiration = ExpirationFrom(opts);
            return descriptor::BuildSsh(ssh);
        }
        case descriptor::Protocol::Vnc: {
            descriptor::VncOptions vnc;
            vnc.hostname = opts.host;
            vnc.password = opts.password;
            vnc.port = opts.port.value_or(constants::kVncDefaultPort);
            vnc.enable_recording = opts.enable_recording;
            vnc.expiration = ExpirationFrom(opts);
            return descriptor::BuildVnc(vnc);
        }
    }
    throw UsageError("Unsupported protocol: " + opts.protocol);
}

int RunEncode(const EncodeArgs& opts, std::ostream& out) {
    config::Settings settings = ApplyCommon(opts.common);
    token::ValidateSecretKey(settings.secret_key);

    descriptor::Descriptor request = BuildDescriptor(opts);
    if (opts.common.verbose) {
        PrintInfo("descriptor: " + descriptor::Summarize(request));
    }
    std::string encoded = token::Encrypt(request, settings.secret_key);
    if (opts.output_url) {
        out << url::BuildConnectUrl(settings.frontend_url, encoded) << "\n";
    } else {
        out << encoded << "\n";
    }
    return kExitOk;
}

int RunDecode(const DecodeArgs& opts, std::ostream& out) {
    config::Settings settings = ApplyCommon(opts.common);
    descriptor::Descriptor request = token::Decrypt(opts.token, settings.secret_key);
    if (opts.common.verbose) {
        PrintInfo("descriptor: " + descriptor::Summarize(request));
    }
    if (descriptor::IsExpired(request, descriptor::NowMillis())) {
        if (!opts.allow_expired) {
            PrintError("token expired");
            return kExitExpired;
        }
        PrintWarning("token expired");
    }
    out << request.dump(2) << "\n";
    return kExitOk;
}

int Run(const std::vector<std::string>& args, std::ostream& out) {
    if (args.empty()) {
        PrintUsage(out);
        return kExitUsage;
    }
    const std::string& command = args.front();
    std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        if (command == "encode") {
            return RunEncode(ParseEncodeArgs(rest), out);
        }
        if (command == "decode") {
            return RunDecode(ParseDecodeArgs(rest), out);
        }
        if (command == "help" || command == "--help" || command == "-h") {
            PrintUsage(out);
            return kExitOk;
        }
        PrintError("Unknown command: " + command);
        PrintUsage(out);
        return kExitUsage;
    } catch (const UsageError& exc) {
        PrintError(exc.what());
        PrintUsage(out);
        return kExitUsage;
    } catch (const ValidationError& exc) {
        PrintError(exc.what());
        return kExitUsage;
    } catch (const ConfigError& exc) {
        PrintError(exc.what());
        return kExitFailure;
    } catch (const DecodeError& exc) {
        PrintError(exc.what());
        return kExitFailure;
    } catch (const std::exception& exc) {
        PrintError(exc.what());
        return kExitFailure;
    }
}

}  // namespace guactoken::cli
