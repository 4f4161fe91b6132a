/**
 * @file registry.h
 * @brief Registry of peers currently present on the network
 *
 * The registry is the only state shared between tasks. Discovery writes it;
 * transport and sync read it. Entries are values replaced as a whole under
 * the registry lock, and every read returns a copy, so no reference into
 * the registry ever escapes.
 */

#ifndef CLIPSYNC_REGISTRY_H
#define CLIPSYNC_REGISTRY_H

#include "platform.h"
#include "types.h"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace clipsync {

/// Default peer time-to-live (three discovery intervals)
constexpr std::chrono::milliseconds DEFAULT_PEER_TTL{15000};

/**
 * @brief Thread-safe map of DeviceId to DeviceInfo with TTL eviction
 *
 * Observer callbacks run on the thread that made the change, after the
 * registry lock is released, so they may call back into the registry.
 */
class CLIPSYNC_API DeviceRegistry {
public:
  explicit DeviceRegistry(std::chrono::milliseconds ttl = DEFAULT_PEER_TTL);
  ~DeviceRegistry();

  // Non-copyable
  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  // ========================================================================
  // Mutation
  // ========================================================================

  /**
   * @brief Insert a peer or refresh an existing one
   *
   * The stored entry is replaced by @p info, except that last_seen never
   * moves backwards.
   *
   * @return true if the peer was not known before
   */
  bool upsert(const DeviceInfo &info);

  /**
   * @brief Insert a configured peer that sweep() never evicts
   *
   * Static peers stay until remove() or clear().
   *
   * @return true if the peer was not known before
   */
  bool add_static(const DeviceInfo &info);

  /**
   * @brief Remove a peer immediately (e.g. on Goodbye)
   * @return true if the peer was present
   */
  bool remove(const DeviceId &id);

  /**
   * @brief Evict every non-static peer with now - last_seen > ttl
   * @return Ids of the evicted peers
   */
  std::vector<DeviceId> sweep(Timestamp now);

  /// Drop all peers without notifying observers
  void clear();

  // ========================================================================
  // Queries
  // ========================================================================

  std::vector<DeviceInfo> snapshot() const;
  std::optional<DeviceInfo> get(const DeviceId &id) const;
  bool contains(const DeviceId &id) const;
  bool is_static(const DeviceId &id) const;
  size_t size() const;

  std::chrono::milliseconds ttl() const { return ttl_; }

  // ========================================================================
  // Callbacks
  // ========================================================================

  void on_device_added(DeviceAddedCallback callback);
  void on_device_removed(DeviceRemovedCallback callback);

private:
  void notify_added(const DeviceInfo &info);
  void notify_removed(const DeviceId &id);

  const std::chrono::milliseconds ttl_;

  mutable std::mutex mutex_;
  std::map<DeviceId, DeviceInfo> devices_;
  std::set<DeviceId> static_ids_;

  std::mutex callback_mutex_;
  DeviceAddedCallback added_cb_;
  DeviceRemovedCallback removed_cb_;
};

} // namespace clipsync

#endif // CLIPSYNC_REGISTRY_H
