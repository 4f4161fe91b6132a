/**
 * @file discovery.cpp
 * @brief Multicast discovery implementation
 */

#include "clipsync/discovery.h"
#include "clipsync/log.h"
#include "clipsync/protocol.h"
#include "socket_util.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace clipsync {

namespace {
constexpr const char *TAG = "discovery";
} // namespace

// ============================================================================
// DiscoveryService Implementation
// ============================================================================

class DiscoveryService::Impl {
public:
  Impl(DeviceRegistry &reg, DeviceInfo local, DiscoveryConfig cfg)
      : registry(reg), config(std::move(cfg)), local_device(std::move(local)) {}

  DeviceRegistry &registry;
  const DiscoveryConfig config;

  mutable std::mutex device_mutex;
  DeviceInfo local_device;

  net::Socket socket;
  sockaddr_in group_addr{};

  std::atomic<bool> running{false};
  std::atomic<bool> stop_requested{false};
  std::mutex timer_mutex;
  std::condition_variable timer_cv;

  std::thread broadcaster;
  std::thread listener;
  std::thread sweeper;

  std::atomic<uint64_t> announcements_sent{0};
  std::atomic<uint64_t> responses_sent{0};
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> own_dropped{0};

  DeviceInfo current_device() const {
    std::lock_guard<std::mutex> lock(device_mutex);
    DeviceInfo info = local_device;
    info.last_seen = std::chrono::system_clock::now();
    return info;
  }

  Result<void> open_socket();
  Result<void> send_to(const DiscoveryMessage &msg, const sockaddr_in &dest);

  // Returns false once stop was requested
  bool sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(timer_mutex);
    return !timer_cv.wait_for(lock, duration,
                              [this] { return stop_requested.load(); });
  }

  void broadcast_loop();
  void listen_loop(DiscoveryService *owner);
  void sweep_loop();
};

Result<void> DiscoveryService::Impl::open_socket() {
  auto group = net::make_address(config.multicast_address,
                                 config.multicast_port);
  if (group.is_error()) {
    return Error(ErrorCode::DiscoveryFailed, group.error().message);
  }
  group_addr = group.value();

  net::Socket sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (!sock) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             "Failed to create UDP socket");
  }

  int reuse = 1;
  if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse,
                   sizeof(reuse)) < 0) {
    CLIPSYNC_LOG_WARN(TAG, "Failed to set SO_REUSEADDR: " +
                               net::errno_string());
  }
#ifdef SO_REUSEPORT
  if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEPORT, &reuse,
                   sizeof(reuse)) < 0) {
    CLIPSYNC_LOG_WARN(TAG, "Failed to set SO_REUSEPORT: " +
                               net::errno_string());
  }
#endif

  sockaddr_in bind_addr{};
  bind_addr.sin_family = AF_INET;
  bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
  bind_addr.sin_port = htons(config.multicast_port);
  if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&bind_addr),
             sizeof(bind_addr)) < 0) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             "Failed to bind discovery port " +
                                 std::to_string(config.multicast_port));
  }

  ip_mreq mreq{};
  mreq.imr_multiaddr = group_addr.sin_addr;
  mreq.imr_interface.s_addr = htonl(INADDR_ANY);
  if (::setsockopt(sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq,
                   sizeof(mreq)) < 0) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             "Failed to join multicast group " +
                                 config.multicast_address);
  }

  unsigned char ttl = static_cast<unsigned char>(config.multicast_ttl);
  if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl,
                   sizeof(ttl)) < 0) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             "Failed to set IP_MULTICAST_TTL");
  }

  unsigned char loop = config.multicast_loop ? 1 : 0;
  if (::setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_LOOP, &loop,
                   sizeof(loop)) < 0) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             "Failed to set IP_MULTICAST_LOOP");
  }

  socket = std::move(sock);
  return Result<void>::ok();
}

Result<void> DiscoveryService::Impl::send_to(const DiscoveryMessage &msg,
                                             const sockaddr_in &dest) {
  Bytes data = serialize_discovery(msg);
  if (data.size() > MAX_DATAGRAM_SIZE) {
    return Error(ErrorCode::InvalidArgument,
                 "Discovery datagram too large (device name too long?)");
  }

  ssize_t sent =
      ::sendto(socket.get(), data.data(), data.size(), 0,
               reinterpret_cast<const sockaddr *>(&dest), sizeof(dest));
  if (sent < 0) {
    return net::socket_error(ErrorCode::DiscoveryFailed,
                             std::string("sendto failed for ") +
                                 discovery_kind_name(msg));
  }
  return Result<void>::ok();
}

void DiscoveryService::Impl::broadcast_loop() {
  do {
    DiscoveryMessage announcement = Announcement{current_device()};
    auto result = send_to(announcement, group_addr);
    if (result.is_error()) {
      CLIPSYNC_LOG_WARN(TAG, "Announcement failed: " +
                                 result.error().to_string());
    } else {
      ++announcements_sent;
    }
  } while (sleep_for(config.interval));
}

void DiscoveryService::Impl::listen_loop(DiscoveryService *owner) {
  Byte buffer[MAX_DATAGRAM_SIZE + 1];

  while (!stop_requested.load()) {
    int ready = net::wait_for(socket.get(), POLLIN, config.receive_timeout);
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      CLIPSYNC_LOG_ERROR(TAG, "poll on discovery socket failed: " +
                                  net::errno_string());
      sleep_for(config.receive_timeout);
      continue;
    }

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    // One byte of headroom to detect oversized datagrams
    ssize_t n = ::recvfrom(socket.get(), buffer, sizeof(buffer), MSG_DONTWAIT,
                           reinterpret_cast<sockaddr *>(&from), &from_len);
    if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        CLIPSYNC_LOG_WARN(TAG, "recvfrom failed: " + net::errno_string());
      }
      continue;
    }

    auto reply = owner->handle_datagram(buffer, static_cast<size_t>(n),
                                        net::address_to_string(from));
    if (reply) {
      auto result = send_to(*reply, from);
      if (result.is_error()) {
        CLIPSYNC_LOG_WARN(TAG, "Response failed: " +
                                   result.error().to_string());
      } else {
        ++responses_sent;
      }
    }
  }
}

void DiscoveryService::Impl::sweep_loop() {
  while (sleep_for(config.interval * 2)) {
    auto evicted = registry.sweep(std::chrono::system_clock::now());
    if (!evicted.empty()) {
      CLIPSYNC_LOG_DEBUG(TAG, "Swept " + std::to_string(evicted.size()) +
                                  " stale peer(s)");
    }
  }
}

// ============================================================================
// DiscoveryService
// ============================================================================

DiscoveryService::DiscoveryService(DeviceRegistry &registry,
                                   DeviceInfo local_device,
                                   DiscoveryConfig config)
    : impl_(std::make_unique<Impl>(registry, std::move(local_device),
                                   std::move(config))) {}

DiscoveryService::~DiscoveryService() { stop(); }

Result<void> DiscoveryService::start() {
  if (impl_->running.load()) {
    return Error(ErrorCode::AlreadyInitialized, "Discovery already running");
  }

  CLIPSYNC_TRY(impl_->open_socket());

  impl_->stop_requested.store(false);
  impl_->running.store(true);
  impl_->listener = std::thread([this] { impl_->listen_loop(this); });
  impl_->broadcaster = std::thread([this] { impl_->broadcast_loop(); });
  impl_->sweeper = std::thread([this] { impl_->sweep_loop(); });

  CLIPSYNC_LOG_INFO(TAG, "Discovery started on " +
                             impl_->config.multicast_address + ":" +
                             std::to_string(impl_->config.multicast_port));
  return Result<void>::ok();
}

void DiscoveryService::stop() {
  if (!impl_->running.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(impl_->timer_mutex);
    impl_->stop_requested.store(true);
  }
  impl_->timer_cv.notify_all();

  if (impl_->broadcaster.joinable())
    impl_->broadcaster.join();
  if (impl_->listener.joinable())
    impl_->listener.join();
  if (impl_->sweeper.joinable())
    impl_->sweeper.join();

  // Best effort, not retried
  auto result = impl_->send_to(make_goodbye(), impl_->group_addr);
  if (result.is_error()) {
    CLIPSYNC_LOG_DEBUG(TAG, "Goodbye not sent: " + result.error().to_string());
  }

  impl_->socket.close();
  CLIPSYNC_LOG_INFO(TAG, "Discovery stopped");
}

bool DiscoveryService::is_running() const { return impl_->running.load(); }

std::optional<DiscoveryMessage>
DiscoveryService::handle_datagram(const Byte *data, size_t length,
                                  const std::string &from_address) {
  ++impl_->datagrams_received;

  auto parsed = parse_discovery(data, length);
  if (parsed.is_error()) {
    ++impl_->parse_errors;
    CLIPSYNC_LOG_DEBUG(TAG, "Dropped datagram from " + from_address + ": " +
                                parsed.error().to_string());
    return std::nullopt;
  }

  const DiscoveryMessage &msg = parsed.value();
  DeviceInfo peer = discovery_device(msg);

  if (peer.id == local_device().id) {
    ++impl_->own_dropped;
    return std::nullopt;
  }

  // Address the peer by where the datagram came from, and age it by our
  // own clock rather than the sender's
  peer.address = from_address;
  peer.last_seen = std::chrono::system_clock::now();

  using Reply = std::optional<DiscoveryMessage>;
  return std::visit(Overloaded{
                        [&](const Announcement &) -> Reply {
                          impl_->registry.upsert(peer);
                          return make_response();
                        },
                        [&](const Response &) -> Reply {
                          impl_->registry.upsert(peer);
                          return std::nullopt;
                        },
                        [&](const Goodbye &) -> Reply {
                          impl_->registry.remove(peer.id);
                          return std::nullopt;
                        },
                    },
                    msg);
}

std::optional<DiscoveryMessage>
DiscoveryService::handle_datagram(const Bytes &data,
                                  const std::string &from_address) {
  return handle_datagram(data.data(), data.size(), from_address);
}

Result<void> DiscoveryService::announce_now() {
  if (!impl_->running.load()) {
    return Error(ErrorCode::NotInitialized, "Discovery not running");
  }
  CLIPSYNC_TRY(impl_->send_to(make_announcement(), impl_->group_addr));
  ++impl_->announcements_sent;
  return Result<void>::ok();
}

DeviceInfo DiscoveryService::local_device() const {
  std::lock_guard<std::mutex> lock(impl_->device_mutex);
  return impl_->local_device;
}

void DiscoveryService::set_local_port(uint16_t port) {
  std::lock_guard<std::mutex> lock(impl_->device_mutex);
  impl_->local_device.port = port;
}

DiscoveryMessage DiscoveryService::make_announcement() const {
  return Announcement{impl_->current_device()};
}

DiscoveryMessage DiscoveryService::make_response() const {
  return Response{impl_->current_device()};
}

DiscoveryMessage DiscoveryService::make_goodbye() const {
  return Goodbye{impl_->current_device()};
}

DiscoveryStats DiscoveryService::get_stats() const {
  DiscoveryStats stats;
  stats.announcements_sent = impl_->announcements_sent.load();
  stats.responses_sent = impl_->responses_sent.load();
  stats.datagrams_received = impl_->datagrams_received.load();
  stats.parse_errors = impl_->parse_errors.load();
  stats.own_datagrams_dropped = impl_->own_dropped.load();
  return stats;
}

const DiscoveryConfig &DiscoveryService::config() const {
  return impl_->config;
}

} // namespace clipsync
