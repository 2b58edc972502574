#include <gtest/gtest.h>

#include <functional>
#include <string>

#include "guactoken/descriptor.hpp"
#include "guactoken/errors.hpp"

namespace {

using guactoken::ValidationError;
using guactoken::descriptor::Descriptor;
namespace descriptor = guactoken::descriptor;

const Descriptor& SettingsOf(const Descriptor& d) {
    return d.at("connection").at("settings");
}

descriptor::RdpOptions SampleRdp() {
    descriptor::RdpOptions opts;
    opts.hostname = "192.168.1.100";
    opts.username = "Administrator";
    opts.password = "pass123";
    return opts;
}

std::string ValidationMessage(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ValidationError& exc) {
        return exc.what();
    }
    return {};
}

// ==================== RDP ====================

TEST(DescriptorRdpTest, DefaultsIncludeFixedLeavesDriveAndRecording) {
    Descriptor d = descriptor::BuildRdp(SampleRdp());
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d.at("connection").at("type"), "rdp");
    const Descriptor& s = SettingsOf(d);
    EXPECT_EQ(s.at("hostname"), "192.168.1.100");
    EXPECT_EQ(s.at("username"), "Administrator");
    EXPECT_EQ(s.at("password"), "pass123");
    EXPECT_EQ(s.at("width"), 1920);
    EXPECT_EQ(s.at("height"), 1080);
    EXPECT_EQ(s.at("dpi"), 96);
    EXPECT_EQ(s.at("security"), "any");
    EXPECT_EQ(s.at("ignore-cert"), true);
    EXPECT_EQ(s.at("enable-wallpaper"), false);
    EXPECT_EQ(s.at("enable-drive"), true);
    EXPECT_EQ(s.at("drive-path"), "/tmp/guac-drive");
    EXPECT_EQ(s.at("create-drive-path"), true);
    EXPECT_EQ(s.at("recording-path"), "${HISTORY_UUID}");
    EXPECT_EQ(s.at("recording-name"), "session");
    EXPECT_FALSE(s.contains("expiration"));
}

TEST(DescriptorRdpTest, DriveAndRecordingCanBeTurnedOff) {
    auto opts = SampleRdp();
    opts.enable_drive = false;
    opts.enable_recording = false;
    opts.width = 1280;
    opts.height = 720;
    const Descriptor s = SettingsOf(descriptor::BuildRdp(opts));
    EXPECT_FALSE(s.contains("enable-drive"));
    EXPECT_FALSE(s.contains("drive-path"));
    EXPECT_FALSE(s.contains("create-drive-path"));
    EXPECT_FALSE(s.contains("recording-path"));
    EXPECT_FALSE(s.contains("recording-name"));
    EXPECT_EQ(s.at("width"), 1280);
    EXPECT_EQ(s.at("height"), 720);
}

TEST(DescriptorRdpTest, KeysFollowInsertionOrder) {
    const Descriptor s = SettingsOf(descriptor::BuildRdp(SampleRdp()));
    auto it = s.begin();
    EXPECT_EQ(it.key(), "hostname");
    ++it;
    EXPECT_EQ(it.key(), "username");
}

TEST(DescriptorRdpTest, MissingFieldsAreAllNamed) {
    descriptor::RdpOptions opts;
    opts.username = "Administrator";
    std::string message = ValidationMessage([&] { descriptor::BuildRdp(opts); });
    EXPECT_NE(message.find("hostname"), std::string::npos);
    EXPECT_NE(message.find("password"), std::string::npos);
    EXPECT_EQ(message.find("username"), std::string::npos);
}

TEST(DescriptorRdpTest, RejectsNonPositiveDimensions) {
    auto opts = SampleRdp();
    opts.width = 0;
    EXPECT_THROW(descriptor::BuildRdp(opts), ValidationError);
    opts.width = 1920;
    opts.height = -1;
    EXPECT_THROW(descriptor::BuildRdp(opts), ValidationError);
}

// ==================== SSH ====================

TEST(DescriptorSshTest, PasswordPreferredOverPrivateKey) {
    descriptor::SshOptions opts;
    opts.hostname = "192.168.1.101";
    opts.username = "ubuntu";
    opts.password = "pass123";
    opts.private_key = "-----BEGIN KEY-----";
    const Descriptor d = descriptor::BuildSsh(opts);
    EXPECT_EQ(d.at("connection").at("type"), "ssh");
    const Descriptor& s = SettingsOf(d);
    EXPECT_EQ(s.at("password"), "pass123");
    EXPECT_FALSE(s.contains("private-key"));
    EXPECT_EQ(s.at("port"), 22);
    EXPECT_EQ(s.at("font-size"), 12);
    EXPECT_EQ(s.at("color-scheme"), "gray-black");
    EXPECT_EQ(s.at("terminal-type"), "xterm-256color");
    EXPECT_EQ(s.at("enable-sftp"), true);
    EXPECT_EQ(s.at("sftp-root-directory"), "/home/ubuntu");
    EXPECT_EQ(s.at("typescript-path"), "${HISTORY_UUID}");
    EXPECT_EQ(s.at("typescript-name"), "session");
}

TEST(DescriptorSshTest, PrivateKeyUsedWhenNoPassword) {
    descriptor::SshOptions opts;
    opts.hostname = "10.0.0.5";
    opts.username = "deploy";
    opts.private_key = "-----BEGIN KEY-----";
    opts.enable_sftp = false;
    opts.enable_recording = false;
    const Descriptor s = SettingsOf(descriptor::BuildSsh(opts));
    EXPECT_EQ(s.at("private-key"), "-----BEGIN KEY-----");
    EXPECT_FALSE(s.contains("password"));
    EXPECT_FALSE(s.contains("enable-sftp"));
    EXPECT_FALSE(s.contains("typescript-path"));
}

TEST(DescriptorSshTest, NeitherPasswordNorKeyIsValidationError) {
    descriptor::SshOptions opts;
    opts.hostname = "10.0.0.5";
    opts.username = "deploy";
    std::string message = ValidationMessage([&] { descriptor::BuildSsh(opts); });
    EXPECT_NE(message.find("password or private key"), std::string::npos);
}

// ==================== VNC ====================

TEST(DescriptorVncTest, DefaultsAndOptionalPassword) {
    descriptor::VncOptions opts;
    opts.hostname = "192.168.1.102";
    const Descriptor s = SettingsOf(descriptor::BuildVnc(opts));
    EXPECT_EQ(s.at("port"), 5900);
    EXPECT_EQ(s.at("color-depth"), 24);
    EXPECT_FALSE(s.contains("password"));
    EXPECT_EQ(s.at("recording-path"), "${HISTORY_UUID}");

    opts.password = "vncpass";
    opts.port = 5901;
    const Descriptor s2 = SettingsOf(descriptor::BuildVnc(opts));
    EXPECT_EQ(s2.at("password"), "vncpass");
    EXPECT_EQ(s2.at("port"), 5901);
}

TEST(DescriptorVncTest, HostnameRequired) {
    EXPECT_THROW(descriptor::BuildVnc({}), ValidationError);
}

// ==================== Join ====================

TEST(DescriptorJoinTest, ProducesExactShape) {
    descriptor::JoinOptions opts;
    opts.connection_id = "abc-123";
    opts.read_only = true;
    Descriptor expected = Descriptor::parse(R"({"connection":{"join":"abc-123","settings":{"read-only":true}}})");
    EXPECT_EQ(descriptor::BuildJoin(opts), expected);
    EXPECT_EQ(descriptor::BuildJoin(opts).dump(),
              R"({"connection":{"join":"abc-123","settings":{"read-only":true}}})");
}

TEST(DescriptorJoinTest, ReadOnlyDefaultsToFalse) {
    descriptor::JoinOptions opts;
    opts.connection_id = "abc-123";
    EXPECT_EQ(SettingsOf(descriptor::BuildJoin(opts)).at("read-only"), false);
}

TEST(DescriptorJoinTest, ConnectionIdRequired) {
    EXPECT_THROW(descriptor::BuildJoin({}), ValidationError);
}

// ==================== Expiration & helpers ====================

TEST(DescriptorExpirationTest, OnlyPastExpirationCounts) {
    auto opts = SampleRdp();
    EXPECT_FALSE(descriptor::IsExpired(descriptor::BuildRdp(opts), descriptor::NowMillis()));

    opts.expiration = 1000;
    Descriptor past = descriptor::BuildRdp(opts);
    EXPECT_EQ(SettingsOf(past).at("expiration"), 1000);
    EXPECT_TRUE(descriptor::IsExpired(past, 1001));
    EXPECT_FALSE(descriptor::IsExpired(past, 1000));
    EXPECT_FALSE(descriptor::IsExpired(past, 999));
    ASSERT_TRUE(descriptor::ExpirationOf(past).has_value());
    EXPECT_EQ(descriptor::ExpirationOf(past).value(), 1000);
}

TEST(DescriptorExpirationTest, JoinNeverExpires) {
    descriptor::JoinOptions opts;
    opts.connection_id = "abc-123";
    EXPECT_FALSE(descriptor::IsExpired(descriptor::BuildJoin(opts), descriptor::NowMillis()));
    EXPECT_FALSE(descriptor::ExpirationOf(Descriptor::object()).has_value());
}

Descriptor WithExpiration(const std::string& literal) {
    return Descriptor::parse(R"({"connection":{"type":"rdp","settings":{"hostname":"h","expiration":)" + literal
                             + "}}}");
}

TEST(DescriptorExpirationTest, FarFutureFloatNeverExpires) {
    Descriptor d = WithExpiration("1e300");
    EXPECT_FALSE(descriptor::ExpirationOf(d).has_value());
    EXPECT_FALSE(descriptor::IsExpired(d, descriptor::NowMillis()));
}

TEST(DescriptorExpirationTest, UnsignedBeyondInt64NeverExpires) {
    Descriptor d = WithExpiration("18446744073709551615");
    EXPECT_FALSE(descriptor::ExpirationOf(d).has_value());
    EXPECT_FALSE(descriptor::IsExpired(d, descriptor::NowMillis()));

    Descriptor max_signed = WithExpiration("9223372036854775807");
    ASSERT_TRUE(descriptor::ExpirationOf(max_signed).has_value());
    EXPECT_FALSE(descriptor::IsExpired(max_signed, descriptor::NowMillis()));
}

TEST(DescriptorExpirationTest, FractionalValueComparesLikeGateway) {
    Descriptor d = WithExpiration("1000.5");
    ASSERT_TRUE(descriptor::ExpirationOf(d).has_value());
    EXPECT_EQ(descriptor::ExpirationOf(d).value(), 1000);
    EXPECT_TRUE(descriptor::IsExpired(d, 1001));
    EXPECT_FALSE(descriptor::IsExpired(d, 1000));
    EXPECT_TRUE(descriptor::IsExpired(WithExpiration("1.5e3"), descriptor::NowMillis()));
    EXPECT_TRUE(descriptor::IsExpired(WithExpiration("-1e300"), 0));
}

TEST(DescriptorExpirationTest, NonNumericNeverExpires) {
    EXPECT_FALSE(descriptor::IsExpired(WithExpiration(R"("soon")"), descriptor::NowMillis()));
    EXPECT_FALSE(descriptor::IsExpired(WithExpiration("null"), descriptor::NowMillis()));
}

TEST(DescriptorProtocolTest, NamesRoundTrip) {
    for (auto protocol : {descriptor::Protocol::Rdp, descriptor::Protocol::Ssh, descriptor::Protocol::Vnc}) {
        auto parsed = descriptor::ProtocolFromString(descriptor::ToString(protocol));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed.value(), protocol);
    }
    EXPECT_FALSE(descriptor::ProtocolFromString("telnet").has_value());
    EXPECT_FALSE(descriptor::ProtocolFromString("RDP").has_value());
}

TEST(DescriptorSummaryTest, MasksSecrets) {
    std::string summary = descriptor::Summarize(descriptor::BuildRdp(SampleRdp()));
    EXPECT_EQ(summary.rfind("rdp ", 0), 0u);
    EXPECT_NE(summary.find("hostname=192.168.1.100"), std::string::npos);
    EXPECT_NE(summary.find("password=***"), std::string::npos);
    EXPECT_EQ(summary.find("pass123"), std::string::npos);

    descriptor::JoinOptions join;
    join.connection_id = "abc-123";
    EXPECT_EQ(descriptor::Summarize(descriptor::BuildJoin(join)), "join abc-123 read-only=false");
}

}  // namespace
