/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <mutex>
#include <pwd.h>
#include <sstream>
#include <string>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "clipsync/config.h"

namespace fs = ::std::filesystem;
using json = nlohmann::json;

namespace clipsync {

namespace {

constexpr const char *TAG = "config";
constexpr size_t MAX_DEVICE_NAME = 64;
constexpr uint32_t MIN_FRAME_SIZE = 1024;

Error config_error(const std::string &message, const std::string &details = "") {
  return Error(ErrorCode::ConfigError, message, details);
}

template <typename T>
Result<void> read_unsigned(const json &doc, const char *key, T &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_number_unsigned()) {
    return config_error(std::string("'") + key +
                        "' must be a non-negative integer");
  }
  auto value = it->get<uint64_t>();
  if (value > std::numeric_limits<T>::max()) {
    return config_error(std::string("'") + key + "' is out of range");
  }
  out = static_cast<T>(value);
  return Result<void>::ok();
}

Result<void> read_string(const json &doc, const char *key, std::string &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_string()) {
    return config_error(std::string("'") + key + "' must be a string");
  }
  out = it->get<std::string>();
  return Result<void>::ok();
}

Result<void> read_bool(const json &doc, const char *key, bool &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_boolean()) {
    return config_error(std::string("'") + key + "' must be true or false");
  }
  out = it->get<bool>();
  return Result<void>::ok();
}

Result<void> read_string_list(const json &doc, const char *key,
                              std::vector<std::string> &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_array()) {
    return config_error(std::string("'") + key + "' must be a list of strings");
  }
  std::vector<std::string> values;
  for (const auto &item : *it) {
    if (!item.is_string()) {
      return config_error(std::string("'") + key +
                          "' must be a list of strings");
    }
    values.push_back(item.get<std::string>());
  }
  out = std::move(values);
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// Static Peers
// ============================================================================

Result<PeerEndpoint> parse_peer_endpoint(const std::string &text) {
  auto colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    return Error(ErrorCode::InvalidArgument,
                 "Static peer must be ip:port: " + text);
  }

  PeerEndpoint endpoint;
  endpoint.address = text.substr(0, colon);
  in_addr addr{};
  if (inet_pton(AF_INET, endpoint.address.c_str(), &addr) != 1) {
    return Error(ErrorCode::InvalidArgument,
                 "Invalid static peer address: " + text);
  }

  std::string digits = text.substr(colon + 1);
  if (digits.size() > 5 ||
      !std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return Error(ErrorCode::InvalidArgument,
                 "Invalid static peer port: " + text);
  }
  unsigned long port = std::stoul(digits);
  if (port == 0 || port > 65535) {
    return Error(ErrorCode::InvalidArgument,
                 "Static peer port out of range: " + text);
  }
  endpoint.port = static_cast<uint16_t>(port);
  return endpoint;
}

// ============================================================================
// ClipSyncConfig Methods
// ============================================================================

void ClipSyncConfig::load_defaults() { *this = ClipSyncConfig(); }

Result<void> ClipSyncConfig::validate() const {
  if (device_name.length() > MAX_DEVICE_NAME) {
    return Error(ErrorCode::InvalidArgument,
                 "Device name too long (max 64 chars)");
  }

  in_addr group{};
  if (inet_pton(AF_INET, multicast_address.c_str(), &group) != 1) {
    return Error(ErrorCode::InvalidArgument,
                 "Invalid multicast address: " + multicast_address);
  }
  uint32_t first_octet = ntohl(group.s_addr) >> 24;
  if (first_octet < 224 || first_octet > 239) {
    return Error(ErrorCode::InvalidArgument,
                 "Not a multicast address: " + multicast_address);
  }

  if (multicast_port == 0) {
    return Error(ErrorCode::InvalidArgument, "Multicast port must be set");
  }

  if (discovery_interval_ms == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Discovery interval must be positive");
  }

  if (peer_ttl_ms < discovery_interval_ms) {
    return Error(ErrorCode::InvalidArgument,
                 "Peer TTL must be at least one discovery interval");
  }

  for (const auto &peer : static_peers) {
    CLIPSYNC_TRY(parse_peer_endpoint(peer));
  }

  if (tcp_base_port < 1024) {
    return Error(ErrorCode::InvalidArgument, "TCP base port must be >= 1024");
  }

  if (port_scan_limit == 0 ||
      static_cast<uint32_t>(tcp_base_port) + port_scan_limit - 1 > 65535) {
    return Error(ErrorCode::InvalidArgument,
                 "Port scan range exceeds the port space");
  }

  if (max_frame_size < MIN_FRAME_SIZE) {
    return Error(ErrorCode::InvalidArgument,
                 "Max frame size must be at least 1024 bytes");
  }

  if (connect_timeout_ms == 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Connect timeout must be positive");
  }

  if (poll_interval_ms == 0) {
    return Error(ErrorCode::InvalidArgument, "Poll interval must be positive");
  }

  return Result<void>::ok();
}

DiscoveryConfig ClipSyncConfig::discovery_config() const {
  DiscoveryConfig cfg;
  cfg.multicast_address = multicast_address;
  cfg.multicast_port = multicast_port;
  cfg.interval = std::chrono::milliseconds(discovery_interval_ms);
  return cfg;
}

TransportConfig ClipSyncConfig::transport_config() const {
  TransportConfig cfg;
  cfg.base_port = tcp_base_port;
  cfg.port_scan_limit = port_scan_limit;
  cfg.max_frame_size = max_frame_size;
  cfg.connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
  return cfg;
}

SyncConfig ClipSyncConfig::sync_config() const {
  SyncConfig cfg;
  cfg.poll_interval = std::chrono::milliseconds(poll_interval_ms);
  cfg.notifications = notifications;
  return cfg;
}

std::string ClipSyncConfig::get_default_device_name() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    return std::string(host);
  }
  return "ClipSync Device";
}

fs::path ClipSyncConfig::get_default_config_dir() {
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && xdg_config[0] != '\0') {
    return fs::path(xdg_config) / "clipsync";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "clipsync";
  }

  return fs::path("/tmp/clipsync");
}

// ============================================================================
// JSON
// ============================================================================

Result<ClipSyncConfig> config_from_json(const std::string &text,
                                        ClipSyncConfig base) {
  json doc;
  try {
    doc = json::parse(text);
  } catch (const json::exception &e) {
    return config_error("Malformed configuration JSON", e.what());
  }

  if (!doc.is_object()) {
    return config_error("Configuration must be a JSON object");
  }

  ClipSyncConfig cfg = std::move(base);
  CLIPSYNC_TRY(read_string(doc, "device_name", cfg.device_name));
  CLIPSYNC_TRY(read_string(doc, "multicast_address", cfg.multicast_address));
  CLIPSYNC_TRY(read_unsigned(doc, "multicast_port", cfg.multicast_port));
  CLIPSYNC_TRY(
      read_unsigned(doc, "discovery_interval_ms", cfg.discovery_interval_ms));
  CLIPSYNC_TRY(read_unsigned(doc, "peer_ttl_ms", cfg.peer_ttl_ms));
  CLIPSYNC_TRY(read_string_list(doc, "static_peers", cfg.static_peers));
  CLIPSYNC_TRY(read_unsigned(doc, "tcp_base_port", cfg.tcp_base_port));
  CLIPSYNC_TRY(read_unsigned(doc, "port_scan_limit", cfg.port_scan_limit));
  CLIPSYNC_TRY(read_unsigned(doc, "poll_interval_ms", cfg.poll_interval_ms));
  CLIPSYNC_TRY(read_unsigned(doc, "max_frame_size", cfg.max_frame_size));
  CLIPSYNC_TRY(read_unsigned(doc, "connect_timeout_ms", cfg.connect_timeout_ms));
  CLIPSYNC_TRY(read_bool(doc, "notifications", cfg.notifications));

  std::string level;
  CLIPSYNC_TRY(read_string(doc, "log_level", level));
  if (!level.empty()) {
    auto parsed = parse_log_level(level);
    if (!parsed) {
      return config_error("Unknown log level: " + level);
    }
    cfg.log_level = *parsed;
  }

  return cfg;
}

std::string config_to_json(const ClipSyncConfig &config) {
  std::string level = log_level_name(config.log_level);
  for (auto &c : level) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  json doc = {
      {"device_name", config.device_name},
      {"multicast_address", config.multicast_address},
      {"multicast_port", config.multicast_port},
      {"discovery_interval_ms", config.discovery_interval_ms},
      {"peer_ttl_ms", config.peer_ttl_ms},
      {"static_peers", config.static_peers},
      {"tcp_base_port", config.tcp_base_port},
      {"port_scan_limit", config.port_scan_limit},
      {"poll_interval_ms", config.poll_interval_ms},
      {"max_frame_size", config.max_frame_size},
      {"connect_timeout_ms", config.connect_timeout_ms},
      {"notifications", config.notifications},
      {"log_level", level},
  };
  return doc.dump(2);
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  ClipSyncConfig config;
  fs::path config_path;
  mutable std::mutex mutex;

  Result<void> load_locked();
  Result<void> save_locked();
};

Result<void> ConfigManager::Impl::load_locked() {
  std::ifstream in(config_path);
  if (!in) {
    return config_error("Cannot open " + config_path.string());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  ClipSyncConfig defaults;
  defaults.device_name = ClipSyncConfig::get_default_device_name();
  auto parsed = config_from_json(buffer.str(), defaults);
  if (parsed.is_error()) {
    auto err = parsed.error();
    err.details = config_path.string() +
                  (err.details.empty() ? "" : ": " + err.details);
    return err;
  }

  auto valid = parsed.value().validate();
  if (valid.is_error()) {
    return config_error(valid.error().message, config_path.string());
  }

  config = std::move(parsed).value();
  CLIPSYNC_LOG_INFO(TAG, "Loaded " + config_path.string());
  return Result<void>::ok();
}

Result<void> ConfigManager::Impl::save_locked() {
  std::error_code ec;
  auto dir = config_path.parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      return config_error("Cannot create " + dir.string(), ec.message());
    }
  }

  std::ofstream out(config_path, std::ios::trunc);
  if (!out) {
    return config_error("Cannot write " + config_path.string());
  }
  out << config_to_json(config) << '\n';
  if (!out) {
    return config_error("Failed writing " + config_path.string());
  }
  return Result<void>::ok();
}

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.device_name = ClipSyncConfig::get_default_device_name();
  impl_->config_path = ClipSyncConfig::get_default_config_dir() / "config.json";
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (!config_path.empty()) {
    impl_->config_path = config_path;
  }

  std::error_code ec;
  if (!fs::exists(impl_->config_path, ec)) {
    CLIPSYNC_LOG_INFO(TAG, "No config at " + impl_->config_path.string() +
                               ", using defaults");
    return Result<void>::ok();
  }

  return impl_->load_locked();
}

const ClipSyncConfig &ConfigManager::get() const { return impl_->config; }

Result<void> ConfigManager::set(const ClipSyncConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->save_locked();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
  impl_->config.device_name = ClipSyncConfig::get_default_device_name();
}

Result<void> ConfigManager::set_device_name(const std::string &name) {
  if (name.empty() || name.length() > MAX_DEVICE_NAME) {
    return Error(ErrorCode::InvalidArgument, "Invalid device name");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.device_name = name;
  return impl_->save_locked();
}

Result<void> ConfigManager::set_notifications(bool enabled) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.notifications = enabled;
  return impl_->save_locked();
}

const fs::path &ConfigManager::config_path() const {
  return impl_->config_path;
}

} // namespace clipsync
