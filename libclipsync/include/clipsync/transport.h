/**
 * @file transport.h
 * @brief TCP transport for clipboard messages
 *
 * Each device listens on one TCP port (advertised via discovery) and keeps
 * at most one outbound connection per peer. Messages travel one way on a
 * connection: a device writes on its outbound connections and reads on the
 * connections it accepted.
 */

#ifndef CLIPSYNC_TRANSPORT_H
#define CLIPSYNC_TRANSPORT_H

#include "error.h"
#include "platform.h"
#include "protocol.h"
#include "registry.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Transport Configuration
// ============================================================================

/**
 * @brief Configuration options for the TCP transport
 */
struct TransportConfig {
  /// First port tried for the listening socket
  uint16_t base_port = 8765;

  /// Number of consecutive ports tried before giving up
  uint16_t port_scan_limit = 100;

  /// Local address the listener binds to
  std::string bind_address = "0.0.0.0";

  /// Largest frame payload accepted or sent
  uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;

  /// Bound on establishing an outbound connection
  std::chrono::milliseconds connect_timeout{3000};

  /// Bound on each wait while writing a frame
  std::chrono::milliseconds write_timeout{5000};

  /// Poll timeout of the accept and read tasks (bounds stop() latency)
  std::chrono::milliseconds poll_timeout{250};

  /// Broadcasts waiting for the outbound task before the oldest is dropped
  size_t broadcast_queue_limit = 16;
};

// ============================================================================
// Broadcast Report
// ============================================================================

struct SendFailure {
  DeviceId peer_id;
  Error error;
};

/**
 * @brief Per-peer outcome of send_to_all()
 */
struct BroadcastReport {
  std::vector<DeviceId> delivered;
  std::vector<SendFailure> failures;

  size_t attempted() const { return delivered.size() + failures.size(); }
  bool all_delivered() const { return failures.empty(); }
};

/// Receives the outcome of each queued broadcast, on the outbound task
using BroadcastObserver =
    std::function<void(const ClipboardMessage &, const BroadcastReport &)>;

/**
 * @brief Counters for diagnostics
 */
struct TransportStats {
  uint64_t connections_accepted = 0;
  uint64_t connections_opened = 0;
  uint64_t messages_sent = 0;
  uint64_t messages_received = 0;
  uint64_t send_failures = 0;
  uint64_t frame_errors = 0;
  uint64_t broadcasts_queued = 0;
  uint64_t broadcasts_dropped = 0;
};

// ============================================================================
// Transport Manager
// ============================================================================

/**
 * @brief Owns the TCP listener and the outbound connection pool
 *
 * Inbound: an accept task hands each connection to its own read task, which
 * reassembles frames and passes every decoded message to the message
 * handler. A frame over max_frame_size or an unparseable payload closes that
 * connection only; the registry is never touched by inbound failures.
 *
 * Outbound: send() looks the peer up in the registry, connects lazily, and
 * on any failure drops the pooled connection so the next send reconnects.
 * There is no background retry. enqueue_broadcast() hands a message to the
 * outbound task, so callers never wait on connect or write timeouts.
 */
class CLIPSYNC_API TransportManager {
public:
  explicit TransportManager(DeviceRegistry &registry,
                            TransportConfig config = {});
  ~TransportManager();

  // Non-copyable
  TransportManager(const TransportManager &) = delete;
  TransportManager &operator=(const TransportManager &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Bind the first free port from base_port and start accepting
   * @return BindFailed if no port in the scan range is available
   */
  Result<void> start();

  /**
   * @brief Close every connection and join all tasks
   */
  void stop();

  bool is_running() const;

  /// Port the listener is bound to (0 before start())
  uint16_t listening_port() const;

  /**
   * @brief Set the receiver of decoded inbound messages
   *
   * Called from the read tasks; must be thread-safe and quick.
   */
  void set_message_handler(MessageHandler handler);

  // ========================================================================
  // Sending
  // ========================================================================

  /**
   * @brief Deliver one message to one peer
   * @return PeerNotFound if the peer is not in the registry,
   *         ConnectionFailed/ConnectionTimeout if it cannot be reached,
   *         ConnectionLost if the write fails,
   *         FrameTooLarge if the message exceeds max_frame_size
   */
  Result<void> send(const DeviceId &peer_id, const ClipboardMessage &message);

  /**
   * @brief Send to every peer in the registry
   *
   * One peer's failure does not stop delivery to the others.
   */
  BroadcastReport send_to_all(const ClipboardMessage &message);

  /**
   * @brief Queue a message for send_to_all() on the outbound task
   *
   * Returns without touching the network. When broadcast_queue_limit
   * messages are already waiting, the oldest is dropped. Messages still
   * queued at stop() are discarded.
   *
   * @return NotInitialized if the transport is not running
   */
  Result<void> enqueue_broadcast(ClipboardMessage message);

  /// Set the receiver of queued broadcast outcomes; may be empty
  void set_broadcast_observer(BroadcastObserver observer);

  /// Broadcasts waiting for the outbound task
  size_t pending_broadcasts() const;

  /**
   * @brief Drop pooled connections to peers no longer in the registry
   * @return Number of connections closed
   */
  size_t prune_connections();

  /// Drop the pooled connection to one peer, if any
  void disconnect(const DeviceId &peer_id);

  // ========================================================================
  // Status
  // ========================================================================

  size_t outbound_connection_count() const;
  size_t inbound_connection_count() const;

  TransportStats get_stats() const;

  const TransportConfig &config() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_TRANSPORT_H
