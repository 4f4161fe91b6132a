/**
 * @file registry.cpp
 * @brief Device registry implementation
 */

#include "clipsync/registry.h"
#include "clipsync/log.h"
#include <algorithm>

namespace clipsync {

DeviceRegistry::DeviceRegistry(std::chrono::milliseconds ttl) : ttl_(ttl) {}

DeviceRegistry::~DeviceRegistry() = default;

// ============================================================================
// Mutation
// ============================================================================

bool DeviceRegistry::upsert(const DeviceInfo &info) {
  bool is_new = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(info.id);
    if (it == devices_.end()) {
      devices_.emplace(info.id, info);
      is_new = true;
    } else {
      DeviceInfo updated = info;
      updated.last_seen = std::max(it->second.last_seen, info.last_seen);
      it->second = std::move(updated);
    }
  }

  if (is_new) {
    CLIPSYNC_LOG_INFO("registry", "Peer joined: " + info.name + " (" +
                                      info.address + ":" +
                                      std::to_string(info.port) + ")");
    notify_added(info);
  }
  return is_new;
}

bool DeviceRegistry::add_static(const DeviceInfo &info) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    static_ids_.insert(info.id);
  }
  return upsert(info);
}

bool DeviceRegistry::remove(const DeviceId &id) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = devices_.erase(id) > 0;
    static_ids_.erase(id);
  }

  if (removed) {
    CLIPSYNC_LOG_INFO("registry", "Peer left: " + id.to_string());
    notify_removed(id);
  }
  return removed;
}

std::vector<DeviceId> DeviceRegistry::sweep(Timestamp now) {
  std::vector<DeviceId> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = devices_.begin(); it != devices_.end();) {
      if (static_ids_.count(it->first) == 0 &&
          now - it->second.last_seen > ttl_) {
        evicted.push_back(it->first);
        it = devices_.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (const auto &id : evicted) {
    CLIPSYNC_LOG_INFO("registry", "Peer timed out: " + id.to_string());
    notify_removed(id);
  }
  return evicted;
}

void DeviceRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
  static_ids_.clear();
}

// ============================================================================
// Queries
// ============================================================================

std::vector<DeviceInfo> DeviceRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<DeviceInfo> result;
  result.reserve(devices_.size());
  for (const auto &[id, info] : devices_) {
    result.push_back(info);
  }
  return result;
}

std::optional<DeviceInfo> DeviceRegistry::get(const DeviceId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(id);
  if (it != devices_.end()) {
    return it->second;
  }
  return std::nullopt;
}

bool DeviceRegistry::contains(const DeviceId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.count(id) > 0;
}

bool DeviceRegistry::is_static(const DeviceId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_ids_.count(id) > 0;
}

size_t DeviceRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

// ============================================================================
// Callbacks
// ============================================================================

void DeviceRegistry::on_device_added(DeviceAddedCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  added_cb_ = std::move(callback);
}

void DeviceRegistry::on_device_removed(DeviceRemovedCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  removed_cb_ = std::move(callback);
}

void DeviceRegistry::notify_added(const DeviceInfo &info) {
  DeviceAddedCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = added_cb_;
  }
  if (cb) {
    cb(info);
  }
}

void DeviceRegistry::notify_removed(const DeviceId &id) {
  DeviceRemovedCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = removed_cb_;
  }
  if (cb) {
    cb(id);
  }
}

} // namespace clipsync
