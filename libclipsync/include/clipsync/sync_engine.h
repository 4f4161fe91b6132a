/**
 * @file sync_engine.h
 * @brief Clipboard change propagation
 *
 * The sync engine polls the local clipboard, broadcasts changes, and applies
 * clipboard messages received from peers. Applied messages are remembered
 * so they are neither re-applied nor echoed back as local changes.
 */

#ifndef CLIPSYNC_SYNC_ENGINE_H
#define CLIPSYNC_SYNC_ENGINE_H

#include "clipboard.h"
#include "error.h"
#include "notification.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace clipsync {

// ============================================================================
// Sync Configuration
// ============================================================================

struct SyncConfig {
  /// How often the local clipboard is checked for changes
  std::chrono::milliseconds poll_interval{500};

  /// How long an applied message id is remembered
  std::chrono::milliseconds dedup_retention{60000};

  /// Most message ids remembered at once (oldest evicted first)
  size_t dedup_capacity = 1024;

  /// Preview length used in notifications
  size_t preview_chars = 50;

  /// Show a desktop notification for each applied message
  bool notifications = true;
};

/**
 * @brief Counters for diagnostics
 */
struct SyncStats {
  uint64_t changes_broadcast = 0;
  uint64_t messages_applied = 0;
  uint64_t duplicates_dropped = 0;
  uint64_t echoes_dropped = 0;
  uint64_t access_errors = 0;
};

/// Receives each local change; normally TransportManager::send_to_all
using BroadcastCallback = std::function<void(const ClipboardMessage &)>;

// ============================================================================
// Sync Engine
// ============================================================================

/**
 * @brief Ties the local clipboard to the network
 *
 * Poll and apply are serialized, so a write made by apply() is always
 * reflected in the last known hash before the next poll reads the
 * clipboard. The first poll adopts the current clipboard as a baseline and
 * does not broadcast it.
 *
 * Inbound messages from the transport go through enqueue() and are applied
 * on the sync task before each poll.
 */
class CLIPSYNC_API SyncEngine {
public:
  SyncEngine(ClipboardAccess &clipboard, DeviceId local_id,
             std::string local_name, SyncConfig config = {});
  ~SyncEngine();

  // Non-copyable
  SyncEngine(const SyncEngine &) = delete;
  SyncEngine &operator=(const SyncEngine &) = delete;

  /// Set the receiver of local changes (before start())
  void set_broadcaster(BroadcastCallback callback);

  /// Set the notifier used for applied messages; may be null
  void set_notifier(Notifier *notifier);

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Start the sync task
   * @return AlreadyInitialized if already running
   */
  Result<void> start();

  /// Stop the sync task; queued messages not yet applied are discarded
  void stop();

  bool is_running() const;

  // ========================================================================
  // Inbound
  // ========================================================================

  /**
   * @brief Queue a message received from a peer
   *
   * Thread-safe; wakes the sync task.
   */
  void enqueue(ClipboardMessage message);

  /**
   * @brief Apply one inbound message now
   *
   * @return true if the clipboard was written, false if the message was an
   *         echo of our own or a duplicate. ClipboardAccessError if the
   *         write failed; the message id is then not remembered.
   */
  Result<bool> apply(const ClipboardMessage &message);

  // ========================================================================
  // Polling
  // ========================================================================

  /**
   * @brief Run one cycle: drain the inbound queue, then check the clipboard
   * @return true if a change was broadcast. ClipboardAccessError if the
   *         clipboard could not be read; the cycle is skipped.
   */
  Result<bool> poll_once();

  // ========================================================================
  // Status
  // ========================================================================

  /// Whether @p id is in the recently-applied set
  bool was_applied(const MessageId &id) const;

  size_t recent_count() const;
  size_t pending_count() const;

  SyncStats get_stats() const;

  const DeviceId &local_id() const;
  const SyncConfig &config() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipsync

#endif // CLIPSYNC_SYNC_ENGINE_H
