/**
 * @file discovery.h
 * @brief Multicast peer discovery for ClipSync
 *
 * Every device periodically announces itself to a multicast group and
 * listens on the same group for other devices. Discovered peers go into
 * the DeviceRegistry, which the transport layer reads to know whom to
 * connect to.
 *
 * Discovery Flow:
 *   1. Broadcast an Announcement every interval
 *   2. Answer each Announcement heard with a unicast Response
 *   3. Record peers from Announcements and Responses
 *   4. Drop peers on Goodbye or after the registry TTL
 */

#ifndef CLIPSYNC_DISCOVERY_H
#define CLIPSYNC_DISCOVERY_H

#include "error.h"
#include "platform.h"
#include "registry.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace clipsync {

// ============================================================================
// Discovery Configuration
// ============================================================================

/**
 * @brief Configuration options for multicast discovery
 */
struct DiscoveryConfig {
  /// Multicast group joined and announced to
  std::string multicast_address = "239.255.255.250";

  /// UDP port of the group
  uint16_t multicast_port = 8765;

  /// Time between announcements; the sweeper runs at twice this
  std::chrono::milliseconds interval{5000};

  /// Listener poll timeout (bounds how long stop() waits for it)
  std::chrono::milliseconds receive_timeout{250};

  /// Multicast hop limit (1 keeps traffic on the local segment)
  int multicast_ttl = 1;

  /// Deliver our own datagrams back to us (other processes on this host
  /// need this to see each other)
  bool multicast_loop = true;
};

/**
 * @brief Counters for diagnostics
 */
struct DiscoveryStats {
  uint64_t announcements_sent = 0;
  uint64_t responses_sent = 0;
  uint64_t datagrams_received = 0;
  uint64_t parse_errors = 0;
  uint64_t own_datagrams_dropped = 0;
};

// ============================================================================
// Discovery Service
// ============================================================================

/**
 * @brief Announces this device and tracks peers via UDP multicast
 *
 * One socket, bound to the group port and joined to the group, is shared
 * by three tasks:
 * - broadcaster: sends an Announcement every interval, and one Goodbye
 *   on stop()
 * - listener: feeds each received datagram to handle_datagram() and sends
 *   any reply back to the datagram's source
 * - sweeper: evicts stale registry entries every 2 x interval
 *
 * Example usage:
 * @code
 *   DeviceRegistry registry;
 *   DiscoveryService discovery(registry, local_device);
 *   discovery.start();
 *   ...
 *   discovery.stop(); // sends Goodbye
 * @endcode
 */
class CLIPSYNC_API DiscoveryService {
public:
  DiscoveryService(DeviceRegistry &registry, DeviceInfo local_device,
                   DiscoveryConfig config = {});
  ~DiscoveryService();

  // Non-copyable
  DiscoveryService(const DiscoveryService &) = delete;
  DiscoveryService &operator=(const DiscoveryService &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Open the multicast socket and start the three tasks
   * @return DiscoveryFailed if the socket cannot be set up,
   *         AlreadyInitialized if already running
   */
  Result<void> start();

  /**
   * @brief Stop all tasks and send one best-effort Goodbye
   */
  void stop();

  bool is_running() const;

  // ========================================================================
  // Datagram Handling
  // ========================================================================

  /**
   * @brief Process one received datagram
   *
   * Updates the registry and returns the reply to send back to the source,
   * if any. Malformed datagrams and our own echoes are dropped.
   *
   * @param data Datagram bytes
   * @param length Datagram size
   * @param from_address Source IPv4 address; recorded as the peer address
   * @return Response for an Announcement, nullopt otherwise
   */
  std::optional<DiscoveryMessage> handle_datagram(const Byte *data,
                                                  size_t length,
                                                  const std::string &from_address);
  std::optional<DiscoveryMessage>
  handle_datagram(const Bytes &data, const std::string &from_address);

  /**
   * @brief Send an Announcement right away instead of waiting for the timer
   */
  Result<void> announce_now();

  // ========================================================================
  // Local Device
  // ========================================================================

  /// Our device as currently advertised
  DeviceInfo local_device() const;

  /// Update the advertised TCP port (after the transport has bound)
  void set_local_port(uint16_t port);

  /// Build a discovery message of the given kind describing this device
  DiscoveryMessage make_announcement() const;
  DiscoveryMessage make_response() const;
  DiscoveryMessage make_goodbye() const;

  DiscoveryStats get_stats() const;

  const DiscoveryConfig &config() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_DISCOVERY_H
