/**
 * @file clipsync.cpp
 * @brief Main ClipSync class implementation
 */

#include "clipsync/clipsync.h"
#include <chrono>
#include <mutex>
#include <vector>

namespace clipsync {

namespace {
constexpr const char *TAG = "clipsync";
} // namespace

VersionInfo get_version() { return VersionInfo(); }

// ============================================================================
// ClipSync Implementation
// ============================================================================

class ClipSync::Impl {
public:
  ClipSyncConfig config;
  bool initialized = false;
  bool running = false;

  DeviceInfo local_device;
  std::vector<DeviceInfo> static_peers;

  std::unique_ptr<ClipboardAccess> clipboard;
  std::unique_ptr<Notifier> notifier;
  std::unique_ptr<DeviceRegistry> registry;
  std::unique_ptr<TransportManager> transport;
  std::unique_ptr<DiscoveryService> discovery;
  std::unique_ptr<SyncEngine> sync;

  std::mutex callback_mutex;
  DeviceAddedCallback added_cb;
  DeviceRemovedCallback removed_cb;

  void broadcast(const ClipboardMessage &message);
  void seed_static_peers();
  void announce_start();
};

void ClipSync::Impl::broadcast(const ClipboardMessage &message) {
  // Runs on the sync task; delivery happens on the transport's outbound task
  auto queued = transport->enqueue_broadcast(message);
  if (queued.is_error()) {
    CLIPSYNC_LOG_WARN(TAG, "Broadcast not queued: " +
                               queued.error().to_string());
  }
}

void ClipSync::Impl::seed_static_peers() {
  auto now = std::chrono::system_clock::now();
  for (auto &peer : static_peers) {
    peer.last_seen = now;
    registry->add_static(peer);
    CLIPSYNC_LOG_INFO(TAG, "Static peer " + peer.name);
  }
}

void ClipSync::Impl::announce_start() {
  if (!config.notifications || !notifier) {
    return;
  }
  auto shown = notifier->notify("ClipSync", "Clipboard sync started as " +
                                                local_device.name);
  if (shown.is_error()) {
    CLIPSYNC_LOG_DEBUG(TAG, "Startup notification not shown: " +
                                shown.error().to_string());
  }
}

ClipSync::ClipSync() : impl_(std::make_unique<Impl>()) {}

ClipSync::~ClipSync() { stop(); }

Result<void> ClipSync::init(const ClipSyncConfig &config,
                            std::unique_ptr<ClipboardAccess> clipboard,
                            std::unique_ptr<Notifier> notifier) {
  if (impl_->initialized) {
    return Error(ErrorCode::AlreadyInitialized, "ClipSync already initialized");
  }

  CLIPSYNC_TRY(config.validate());
  CLIPSYNC_TRY(security_init());

  impl_->config = config;
  if (impl_->config.device_name.empty()) {
    impl_->config.device_name = ClipSyncConfig::get_default_device_name();
  }
  logger().set_level(impl_->config.log_level);

  if (!clipboard) {
    auto system = create_system_clipboard();
    if (system.is_error()) {
      return system.error();
    }
    clipboard = std::move(system).value();
  }
  if (!notifier && impl_->config.notifications) {
    notifier = create_desktop_notifier();
  }
  impl_->clipboard = std::move(clipboard);
  if (notifier) {
    impl_->notifier = std::make_unique<AsyncNotifier>(std::move(notifier));
  }

  // Validated above
  impl_->static_peers.clear();
  for (const auto &text : impl_->config.static_peers) {
    auto endpoint = parse_peer_endpoint(text);
    if (endpoint.is_error()) {
      return endpoint.error();
    }
    DeviceInfo peer;
    peer.id = DeviceId::generate();
    peer.name = endpoint.value().to_string();
    peer.address = endpoint.value().address;
    peer.port = endpoint.value().port;
    impl_->static_peers.push_back(std::move(peer));
  }

  impl_->local_device.id = DeviceId::generate();
  impl_->local_device.name = impl_->config.device_name;
  impl_->local_device.address = "0.0.0.0";

  impl_->registry = std::make_unique<DeviceRegistry>(
      std::chrono::milliseconds(impl_->config.peer_ttl_ms));
  impl_->transport = std::make_unique<TransportManager>(
      *impl_->registry, impl_->config.transport_config());
  impl_->discovery = std::make_unique<DiscoveryService>(
      *impl_->registry, impl_->local_device, impl_->config.discovery_config());
  impl_->sync = std::make_unique<SyncEngine>(
      *impl_->clipboard, impl_->local_device.id, impl_->local_device.name,
      impl_->config.sync_config());

  Impl *impl = impl_.get();
  impl_->sync->set_notifier(impl_->notifier.get());
  impl_->sync->set_broadcaster(
      [impl](const ClipboardMessage &message) { impl->broadcast(message); });
  impl_->transport->set_message_handler([impl](ClipboardMessage message) {
    impl->sync->enqueue(std::move(message));
  });

  impl_->registry->on_device_added([impl](const DeviceInfo &info) {
    DeviceAddedCallback cb;
    {
      std::lock_guard<std::mutex> lock(impl->callback_mutex);
      cb = impl->added_cb;
    }
    if (cb) {
      cb(info);
    }
  });
  impl_->registry->on_device_removed([impl](const DeviceId &id) {
    size_t closed = impl->transport->prune_connections();
    if (closed > 0) {
      CLIPSYNC_LOG_DEBUG(TAG, "Closed " + std::to_string(closed) +
                                  " connection(s) to departed peers");
    }
    DeviceRemovedCallback cb;
    {
      std::lock_guard<std::mutex> lock(impl->callback_mutex);
      cb = impl->removed_cb;
    }
    if (cb) {
      cb(id);
    }
  });

  impl_->initialized = true;
  CLIPSYNC_LOG_INFO(TAG, "Initialized as " + impl_->local_device.name + " (" +
                             impl_->local_device.id.to_string() + ")");
  return Result<void>::ok();
}

Result<void> ClipSync::start() {
  if (!impl_->initialized) {
    return Error(ErrorCode::NotInitialized, "ClipSync not initialized");
  }
  if (impl_->running) {
    return Result<void>::ok();
  }

  CLIPSYNC_TRY(impl_->transport->start());

  impl_->discovery->set_local_port(impl_->transport->listening_port());
  impl_->seed_static_peers();
  auto discovery = impl_->discovery->start();
  if (discovery.is_error()) {
    impl_->transport->stop();
    impl_->registry->clear();
    return discovery;
  }

  auto sync = impl_->sync->start();
  if (sync.is_error()) {
    impl_->discovery->stop();
    impl_->transport->stop();
    impl_->registry->clear();
    return sync;
  }

  impl_->running = true;
  CLIPSYNC_LOG_INFO(TAG, "Running on TCP port " +
                             std::to_string(impl_->transport->listening_port()));
  impl_->announce_start();
  return Result<void>::ok();
}

void ClipSync::stop() {
  if (!impl_->running) {
    return;
  }

  impl_->sync->stop();
  impl_->discovery->stop();
  impl_->transport->stop();
  impl_->registry->clear();
  impl_->running = false;
  CLIPSYNC_LOG_INFO(TAG, "Stopped");
}

bool ClipSync::is_initialized() const { return impl_->initialized; }

bool ClipSync::is_running() const { return impl_->running; }

DeviceInfo ClipSync::get_local_device() const {
  if (impl_->discovery) {
    return impl_->discovery->local_device();
  }
  return impl_->local_device;
}

DeviceId ClipSync::get_local_id() const { return impl_->local_device.id; }

std::vector<DeviceInfo> ClipSync::get_peers() const {
  if (!impl_->registry) {
    return {};
  }
  return impl_->registry->snapshot();
}

void ClipSync::on_device_discovered(DeviceAddedCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->added_cb = std::move(callback);
}

void ClipSync::on_device_lost(DeviceRemovedCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->callback_mutex);
  impl_->removed_cb = std::move(callback);
}

const ClipSyncConfig &ClipSync::get_config() const { return impl_->config; }

DeviceRegistry &ClipSync::get_registry() { return *impl_->registry; }

DiscoveryService &ClipSync::get_discovery() { return *impl_->discovery; }

TransportManager &ClipSync::get_transport() { return *impl_->transport; }

SyncEngine &ClipSync::get_sync_engine() { return *impl_->sync; }

ClipboardAccess &ClipSync::get_clipboard() { return *impl_->clipboard; }

} // namespace clipsync
