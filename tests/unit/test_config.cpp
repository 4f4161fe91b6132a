/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading and validation
 */

#include <clipsync/config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace clipsync;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("clipsync_config_" + Uuid::generate().to_string());
    fs::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir, ec);
  }

  fs::path write_file(const std::string &content) {
    fs::path path = dir / "config.json";
    std::ofstream out(path);
    out << content;
    return path;
  }

  fs::path dir;
};

// ============================================================================
// Defaults and Validation
// ============================================================================

TEST_F(ConfigTest, DefaultsValidate) {
  ClipSyncConfig config;
  EXPECT_TRUE(config.validate().is_ok());

  EXPECT_EQ(config.multicast_address, "239.255.255.250");
  EXPECT_EQ(config.multicast_port, 8765);
  EXPECT_EQ(config.discovery_interval_ms, 5000u);
  EXPECT_EQ(config.peer_ttl_ms, 15000u);
  EXPECT_EQ(config.tcp_base_port, 8765);
  EXPECT_EQ(config.port_scan_limit, 100);
  EXPECT_EQ(config.poll_interval_ms, 500u);
  EXPECT_EQ(config.max_frame_size, 8388608u);
  EXPECT_EQ(config.connect_timeout_ms, 3000u);
  EXPECT_TRUE(config.notifications);
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_TRUE(config.static_peers.empty());
}

TEST_F(ConfigTest, RejectsBadValues) {
  ClipSyncConfig config;
  config.multicast_address = "192.168.1.1";
  EXPECT_TRUE(config.validate().is_error());

  config = ClipSyncConfig();
  config.multicast_address = "not-an-address";
  EXPECT_TRUE(config.validate().is_error());

  config = ClipSyncConfig();
  config.peer_ttl_ms = 1000;
  EXPECT_TRUE(config.validate().is_error());

  config = ClipSyncConfig();
  config.tcp_base_port = 65500;
  EXPECT_TRUE(config.validate().is_error());

  config = ClipSyncConfig();
  config.poll_interval_ms = 0;
  EXPECT_TRUE(config.validate().is_error());

  config = ClipSyncConfig();
  config.device_name = std::string(65, 'x');
  EXPECT_TRUE(config.validate().is_error());
}

TEST_F(ConfigTest, ComponentConfigs) {
  ClipSyncConfig config;
  config.discovery_interval_ms = 2000;
  config.tcp_base_port = 9100;
  config.poll_interval_ms = 250;
  config.notifications = false;

  EXPECT_EQ(config.discovery_config().interval.count(), 2000);
  EXPECT_EQ(config.transport_config().base_port, 9100);
  EXPECT_EQ(config.sync_config().poll_interval.count(), 250);
  EXPECT_FALSE(config.sync_config().notifications);
}

TEST_F(ConfigTest, DefaultConfigDirFollowsXdg) {
  const char *old = std::getenv("XDG_CONFIG_HOME");
  std::string saved = old ? old : "";

  setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
  EXPECT_EQ(ClipSyncConfig::get_default_config_dir(),
            fs::path("/tmp/xdg-test/clipsync"));

  if (old) {
    setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
  } else {
    unsetenv("XDG_CONFIG_HOME");
  }
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(ConfigTest, JsonOverridesOnlyPresentKeys) {
  auto parsed = config_from_json(
      R"({"device_name": "Desk", "tcp_base_port": 9000, "log_level": "debug"})");
  ASSERT_TRUE(parsed.is_ok()) << parsed.error().to_string();

  const auto &config = parsed.value();
  EXPECT_EQ(config.device_name, "Desk");
  EXPECT_EQ(config.tcp_base_port, 9000);
  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_EQ(config.multicast_port, 8765);
  EXPECT_EQ(config.poll_interval_ms, 500u);
}

TEST_F(ConfigTest, MalformedJsonIsConfigError) {
  auto parsed = config_from_json("{ not json");
  ASSERT_TRUE(parsed.is_error());
  EXPECT_EQ(parsed.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, WrongTypesAreConfigErrors) {
  EXPECT_EQ(config_from_json(R"({"multicast_port": "8765"})").error().code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json(R"({"multicast_port": 70000})").error().code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json(R"({"poll_interval_ms": -5})").error().code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json(R"({"notifications": 1})").error().code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json(R"({"log_level": "loud"})").error().code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json("[1, 2]").error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, JsonWriteReadBack) {
  ClipSyncConfig config;
  config.device_name = "Laptop";
  config.peer_ttl_ms = 20000;
  config.notifications = false;
  config.log_level = LogLevel::Warning;
  config.static_peers = {"192.168.1.20:8765"};

  auto parsed = config_from_json(config_to_json(config));
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().device_name, "Laptop");
  EXPECT_EQ(parsed.value().peer_ttl_ms, 20000u);
  EXPECT_FALSE(parsed.value().notifications);
  EXPECT_EQ(parsed.value().log_level, LogLevel::Warning);
  EXPECT_EQ(parsed.value().static_peers, config.static_peers);
}

TEST_F(ConfigTest, StaticPeersFromJson) {
  auto parsed = config_from_json(
      R"({"static_peers": ["192.168.1.20:8765", "10.0.0.7:9000"]})");
  ASSERT_TRUE(parsed.is_ok());
  ASSERT_EQ(parsed.value().static_peers.size(), 2u);
  EXPECT_EQ(parsed.value().static_peers[1], "10.0.0.7:9000");
  EXPECT_TRUE(parsed.value().validate().is_ok());

  EXPECT_EQ(config_from_json(R"({"static_peers": "10.0.0.7:9000"})")
                .error()
                .code,
            ErrorCode::ConfigError);
  EXPECT_EQ(config_from_json(R"({"static_peers": [8765]})").error().code,
            ErrorCode::ConfigError);
}

TEST_F(ConfigTest, ParsePeerEndpoint) {
  auto endpoint = parse_peer_endpoint("192.168.1.20:8765");
  ASSERT_TRUE(endpoint.is_ok());
  EXPECT_EQ(endpoint.value().address, "192.168.1.20");
  EXPECT_EQ(endpoint.value().port, 8765);
  EXPECT_EQ(endpoint.value().to_string(), "192.168.1.20:8765");

  for (const char *bad : {"192.168.1.20", "192.168.1.20:", ":8765",
                          "laptop.local:8765", "192.168.1.20:0",
                          "192.168.1.20:65536", "192.168.1.20:87a5",
                          "192.168.1.20:-1"}) {
    auto result = parse_peer_endpoint(bad);
    ASSERT_TRUE(result.is_error()) << bad;
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument) << bad;
  }
}

TEST_F(ConfigTest, BadStaticPeerFailsValidation) {
  ClipSyncConfig config;
  config.static_peers = {"10.0.0.7:9000", "not-an-endpoint"};
  auto result = config.validate();
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

  auto path = write_file(R"({"static_peers": ["10.0.0.7"]})");
  ConfigManager manager;
  auto loaded = manager.init(path);
  ASSERT_TRUE(loaded.is_error());
  EXPECT_EQ(loaded.error().code, ErrorCode::ConfigError);
}

// ============================================================================
// ConfigManager
// ============================================================================

TEST_F(ConfigTest, ManagerMissingFileUsesDefaults) {
  ConfigManager manager;
  auto result = manager.init(dir / "absent.json");
  ASSERT_TRUE(result.is_ok());
  EXPECT_FALSE(manager.get().device_name.empty());
  EXPECT_EQ(manager.get().tcp_base_port, 8765);
}

TEST_F(ConfigTest, ManagerLoadsFile) {
  auto path = write_file(R"({"device_name": "Desk", "poll_interval_ms": 1000})");

  ConfigManager manager;
  ASSERT_TRUE(manager.init(path).is_ok());
  EXPECT_EQ(manager.get().device_name, "Desk");
  EXPECT_EQ(manager.get().poll_interval_ms, 1000u);
  EXPECT_EQ(manager.config_path(), path);
}

TEST_F(ConfigTest, ManagerRejectsBadFile) {
  auto path = write_file("{\"multicast_port\": ");

  ConfigManager manager;
  auto result = manager.init(path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, ManagerRejectsInvalidValues) {
  auto path = write_file(R"({"peer_ttl_ms": 10, "discovery_interval_ms": 5000})");

  ConfigManager manager;
  auto result = manager.init(path);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, ManagerSaveAndReload) {
  fs::path path = dir / "nested" / "config.json";

  ConfigManager manager;
  ASSERT_TRUE(manager.init(path).is_ok());
  ASSERT_TRUE(manager.set_device_name("Renamed").is_ok());
  EXPECT_TRUE(fs::exists(path));

  ConfigManager reloaded;
  ASSERT_TRUE(reloaded.init(path).is_ok());
  EXPECT_EQ(reloaded.get().device_name, "Renamed");
}

TEST_F(ConfigTest, ManagerSetValidates) {
  ConfigManager manager;
  ClipSyncConfig bad;
  bad.poll_interval_ms = 0;
  EXPECT_TRUE(manager.set(bad).is_error());

  EXPECT_TRUE(manager.set_device_name("").is_error());
}
