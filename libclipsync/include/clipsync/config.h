/**
 * @file config.h
 * @brief User configuration for ClipSync
 */

#ifndef CLIPSYNC_CONFIG_H
#define CLIPSYNC_CONFIG_H

#include "discovery.h"
#include "error.h"
#include "log.h"
#include "platform.h"
#include "sync_engine.h"
#include "transport.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Static Peers
// ============================================================================

/// A peer configured by address, for networks that drop multicast
struct PeerEndpoint {
  std::string address;
  uint16_t port = 0;

  std::string to_string() const {
    return address + ":" + std::to_string(port);
  }
};

/**
 * @brief Parse "a.b.c.d:port"
 * @return InvalidArgument for anything else, or for port 0
 */
CLIPSYNC_API Result<PeerEndpoint> parse_peer_endpoint(const std::string &text);

// ============================================================================
// User Configuration
// ============================================================================

/**
 * @brief Complete configuration of one ClipSync device
 */
struct ClipSyncConfig {
  // ========================================================================
  // Identity
  // ========================================================================

  /// Name shown to other devices
  std::string device_name;

  // ========================================================================
  // Discovery
  // ========================================================================

  std::string multicast_address = "239.255.255.250";
  uint16_t multicast_port = 8765;

  /// Interval between announcements
  uint32_t discovery_interval_ms = 5000;

  /// A peer not heard from for this long is dropped
  uint32_t peer_ttl_ms = 15000;

  /// Peers added at start as "ip:port" and never expired
  std::vector<std::string> static_peers;

  // ========================================================================
  // Transport
  // ========================================================================

  /// First TCP port tried for the listener
  uint16_t tcp_base_port = 8765;

  /// Number of consecutive ports tried
  uint16_t port_scan_limit = 100;

  uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
  uint32_t connect_timeout_ms = 3000;

  // ========================================================================
  // Sync
  // ========================================================================

  uint32_t poll_interval_ms = 500;

  /// Show desktop notifications (applied peer clipboards, startup)
  bool notifications = true;

  // ========================================================================
  // Logging
  // ========================================================================

  LogLevel log_level = LogLevel::Info;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Check ranges and formats
  Result<void> validate() const;

  DiscoveryConfig discovery_config() const;
  TransportConfig transport_config() const;
  SyncConfig sync_config() const;

  /// Host name, or "ClipSync Device" if it cannot be read
  static std::string get_default_device_name();

  /// $XDG_CONFIG_HOME/clipsync or ~/.config/clipsync
  static std::filesystem::path get_default_config_dir();
};

/**
 * @brief Overlay the keys present in a JSON document onto @p base
 * @return ConfigError for malformed JSON, a non-object document, or a key
 *         with the wrong type
 */
CLIPSYNC_API Result<ClipSyncConfig> config_from_json(const std::string &text,
                                                     ClipSyncConfig base = {});

/// Serialize every key as a pretty-printed JSON object
CLIPSYNC_API std::string config_to_json(const ClipSyncConfig &config);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Loads, validates and saves the configuration file
 */
class CLIPSYNC_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  /**
   * @brief Set the config file path and load it if it exists
   *
   * A missing file is not an error; defaults are used.
   *
   * @param config_path File to use (default location if empty)
   * @return ConfigError if the file exists but cannot be parsed or fails
   *         validation
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  const ClipSyncConfig &get() const;

  /**
   * @brief Replace the configuration after validating it
   */
  Result<void> set(const ClipSyncConfig &config);

  /**
   * @brief Reload from the config file; missing keys keep their defaults
   */
  Result<void> load();

  /**
   * @brief Write the configuration file, creating its directory
   */
  Result<void> save();

  void reset_defaults();

  Result<void> set_device_name(const std::string &name);
  Result<void> set_notifications(bool enabled);

  const std::filesystem::path &config_path() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_CONFIG_H
