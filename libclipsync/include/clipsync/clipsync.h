/**
 * @file clipsync.h
 * @brief Main ClipSync API Header
 *
 * ClipSync keeps the clipboards of devices on one LAN in sync, without a
 * server. Devices find each other by multicast announcements and push
 * clipboard changes to every known peer over TCP.
 *
 * Quick Start:
 * @code
 *   #include <clipsync/clipsync.h>
 *
 *   clipsync::ClipSyncConfig config;
 *   config.device_name = "Laptop";
 *
 *   clipsync::ClipSync app;
 *   app.init(config);
 *   app.start();
 *   ...
 *   app.stop();
 * @endcode
 */

#ifndef CLIPSYNC_CLIPSYNC_H
#define CLIPSYNC_CLIPSYNC_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules
#include "clipboard.h"
#include "config.h"
#include "discovery.h"
#include "log.h"
#include "notification.h"
#include "protocol.h"
#include "registry.h"
#include "security.h"
#include "sync_engine.h"
#include "transport.h"

#include <functional>
#include <memory>
#include <vector>

namespace clipsync {

// ============================================================================
// Version Information
// ============================================================================

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char *VERSION_STRING = "1.0.0";

struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  int protocol_version = PROTOCOL_VERSION;
};

CLIPSYNC_API VersionInfo get_version();

// ============================================================================
// Main ClipSync Class
// ============================================================================

/**
 * @brief Owns and wires every component of one device
 *
 * Start order is transport (so its port is known), discovery, then sync.
 * Stop runs in reverse, so the Goodbye goes out while the transport is
 * still up.
 */
class CLIPSYNC_API ClipSync {
public:
  ClipSync();
  ~ClipSync();

  // Non-copyable
  ClipSync(const ClipSync &) = delete;
  ClipSync &operator=(const ClipSync &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Build the components from @p config
   *
   * @param clipboard Clipboard to sync; the system clipboard if null
   * @param notifier Notification sink; the desktop notifier if null and
   *        notifications are enabled. It is called from a task of its own.
   * @return InvalidArgument if the config does not validate,
   *         NotSupported if no system clipboard is available
   */
  Result<void> init(const ClipSyncConfig &config,
                    std::unique_ptr<ClipboardAccess> clipboard = nullptr,
                    std::unique_ptr<Notifier> notifier = nullptr);

  /**
   * @brief Start transport, discovery and sync
   *
   * Configured static peers are added to the registry once the transport
   * is up, and a startup notification is shown when notifications are on.
   * On failure everything already started is stopped again.
   */
  Result<void> start();

  /// Stop all components; safe to call repeatedly
  void stop();

  bool is_initialized() const;
  bool is_running() const;

  // ========================================================================
  // Devices
  // ========================================================================

  DeviceInfo get_local_device() const;
  DeviceId get_local_id() const;

  /// Peers currently in the registry
  std::vector<DeviceInfo> get_peers() const;

  void on_device_discovered(DeviceAddedCallback callback);
  void on_device_lost(DeviceRemovedCallback callback);

  // ========================================================================
  // Component Access (Advanced)
  // ========================================================================

  // Only valid after a successful init()

  const ClipSyncConfig &get_config() const;

  DeviceRegistry &get_registry();
  DiscoveryService &get_discovery();
  TransportManager &get_transport();
  SyncEngine &get_sync_engine();
  ClipboardAccess &get_clipboard();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_CLIPSYNC_H
