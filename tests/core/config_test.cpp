#include "lanbeam/core/config.hpp"
#include "lanbeam/core/types.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using lanbeam::ClientConfig;
using lanbeam::ErrorKind;

TEST(ConfigTest, DefaultsAreValid) {
    ClientConfig config;
    EXPECT_TRUE(lanbeam::validate_config(config).is_ok());
    EXPECT_EQ(config.limits.block_size, 16u * 1024u);
    EXPECT_EQ(config.limits.high_water_mark, 1024u * 1024u);
    EXPECT_EQ(config.max_pin_attempts, 3u);
    EXPECT_EQ(config.protocol_version, "2.3");
}

TEST(ConfigTest, JsonOverlaysOnlyPresentKeys) {
    auto result = lanbeam::apply_json(R"({
        "alias": "laptop",
        "pin": "1234",
        "block_size": 8192,
        "reconnect_backoff_ms": 250,
        "device_type": "desktop"
    })");
    ASSERT_TRUE(result.is_ok()) << result.error().message;

    const auto& config = result.value();
    EXPECT_EQ(config.alias, "laptop");
    ASSERT_TRUE(config.pin.has_value());
    EXPECT_EQ(*config.pin, "1234");
    EXPECT_EQ(config.limits.block_size, 8192u);
    EXPECT_EQ(config.reconnect_backoff.count(), 250);
    EXPECT_EQ(config.device_type, lanbeam::DeviceType::Desktop);
    EXPECT_EQ(config.relay_url, ClientConfig{}.relay_url);
}

TEST(ConfigTest, RejectsMalformedInput) {
    EXPECT_EQ(lanbeam::apply_json("{not json").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(lanbeam::apply_json("[1,2]").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(lanbeam::apply_json(R"({"block_size": "big"})").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(lanbeam::apply_json(R"({"device_type": "toaster"})").error().kind, ErrorKind::InvalidArgument);
}

TEST(ConfigTest, ValidationCatchesBadLimits) {
    ClientConfig config;
    config.limits.high_water_mark = config.limits.block_size - 1;
    EXPECT_TRUE(lanbeam::validate_config(config).is_error());

    config = ClientConfig{};
    config.relay_url = "http://relay";
    EXPECT_TRUE(lanbeam::validate_config(config).is_error());

    config = ClientConfig{};
    config.pin = "";
    EXPECT_TRUE(lanbeam::validate_config(config).is_error());

    config = ClientConfig{};
    config.max_pin_attempts = 0;
    EXPECT_TRUE(lanbeam::validate_config(config).is_error());
}

TEST(ConfigTest, LoadsFileAndAppliesEnvironment) {
    auto path = std::filesystem::temp_directory_path() / "lanbeam_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"alias": "from-file", "relay_url": "ws://127.0.0.1:9000/v1/ws"})";
    }

    auto loaded = lanbeam::load_config_file(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    EXPECT_EQ(loaded.value().alias, "from-file");

    ::setenv("LANBEAM_ALIAS", "from-env", 1);
    auto config = lanbeam::apply_environment(loaded.value());
    ::unsetenv("LANBEAM_ALIAS");

    EXPECT_EQ(config.alias, "from-env");
    EXPECT_EQ(config.relay_url, "ws://127.0.0.1:9000/v1/ws");
}

TEST(ConfigTest, MissingFileIsInvalidArgument) {
    auto loaded = lanbeam::load_config_file("/nonexistent/lanbeam.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::InvalidArgument);
}

TEST(TypesJsonTest, PeerIdentityUsesWireNames) {
    lanbeam::PeerIdentity peer;
    peer.id = "abc";
    peer.info.alias = "Phone";
    peer.info.protocol_version = "2.3";
    peer.info.device_type = lanbeam::DeviceType::Mobile;
    peer.info.auth_token = "tok";

    nlohmann::json j = peer;
    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["alias"], "Phone");
    EXPECT_EQ(j["version"], "2.3");
    EXPECT_EQ(j["deviceType"], "mobile");
    EXPECT_EQ(j["fingerprint"], "tok");
    EXPECT_FALSE(j.contains("deviceModel"));
}

TEST(TypesJsonTest, RegistrationTokenReadFromEitherKey) {
    auto current = nlohmann::json::parse(R"({"id": "x", "alias": "A", "fingerprint": "fp"})").get<lanbeam::PeerIdentity>();
    EXPECT_EQ(current.info.auth_token, "fp");

    auto legacy = nlohmann::json::parse(R"({"id": "x", "alias": "A", "token": "tk"})").get<lanbeam::PeerIdentity>();
    EXPECT_EQ(legacy.info.auth_token, "tk");
}

TEST(TypesJsonTest, UnknownDeviceTypeIsTolerated) {
    auto j = nlohmann::json::parse(R"({"id": "x", "alias": "A", "version": "2.3", "deviceType": "fridge"})");
    auto peer = j.get<lanbeam::PeerIdentity>();
    EXPECT_EQ(peer.id, "x");
    EXPECT_FALSE(peer.info.device_type.has_value());
}

TEST(TypesJsonTest, FileDescriptorDefaultsMimeType) {
    auto j = nlohmann::json::parse(R"({"id": "1", "fileName": "a.bin", "size": 10, "metadata": {"modified": "2024-01-01T00:00:00.000Z"}})");
    auto file = j.get<lanbeam::FileDescriptor>();
    EXPECT_EQ(file.mime_type, "application/octet-stream");
    EXPECT_EQ(file.size, 10u);
    EXPECT_FALSE(file.sha256.has_value());
    ASSERT_TRUE(file.metadata.modified.has_value());
}
