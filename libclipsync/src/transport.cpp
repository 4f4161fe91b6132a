/**
 * @file transport.cpp
 * @brief TCP transport implementation
 */

#include "clipsync/transport.h"
#include "clipsync/log.h"
#include "socket_util.h"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <thread>

namespace clipsync {

namespace {

constexpr const char *TAG = "transport";
constexpr size_t READ_BUFFER_SIZE = 64 * 1024;
constexpr int LISTEN_BACKLOG = 16;

/// Accepted connection and the task reading it
struct InboundConnection {
  net::Socket socket;
  std::string peer;
  std::thread thread;
  std::atomic<bool> finished{false};
};

/// Pooled connection to one peer
struct OutboundConnection {
  net::Socket socket;
  std::string address;
  uint16_t port = 0;
  std::mutex write_mutex;
};

/**
 * @brief Check whether the peer has closed or reset the connection
 *
 * Peers never write on connections we opened, so any readable state means
 * EOF or an error.
 */
bool peer_closed(int fd) {
  if (net::wait_for(fd, POLLIN, std::chrono::milliseconds(0)) == 0) {
    return false;
  }
  Byte peek;
  ssize_t n = ::recv(fd, &peek, 1, MSG_PEEK | MSG_DONTWAIT);
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    return false;
  }
  return n <= 0;
}

} // namespace

// ============================================================================
// TransportManager Implementation
// ============================================================================

class TransportManager::Impl {
public:
  Impl(DeviceRegistry &reg, TransportConfig cfg)
      : registry(reg), config(std::move(cfg)) {}

  DeviceRegistry &registry;
  const TransportConfig config;

  net::Socket listen_socket;
  std::atomic<uint16_t> port{0};
  std::atomic<bool> running{false};
  std::thread accept_thread;

  std::mutex inbound_mutex;
  std::list<std::unique_ptr<InboundConnection>> inbound;

  mutable std::mutex pool_mutex;
  std::map<DeviceId, std::shared_ptr<OutboundConnection>> pool;

  std::mutex handler_mutex;
  MessageHandler handler;
  BroadcastObserver observer;

  std::thread outbound_thread;
  mutable std::mutex outbound_mutex;
  std::condition_variable outbound_cv;
  std::deque<ClipboardMessage> outbound;

  std::atomic<uint64_t> connections_accepted{0};
  std::atomic<uint64_t> connections_opened{0};
  std::atomic<uint64_t> messages_sent{0};
  std::atomic<uint64_t> messages_received{0};
  std::atomic<uint64_t> send_failures{0};
  std::atomic<uint64_t> frame_errors{0};
  std::atomic<uint64_t> broadcasts_queued{0};
  std::atomic<uint64_t> broadcasts_dropped{0};

  Result<void> bind_listener();
  void accept_loop();
  void outbound_loop();
  void read_loop(InboundConnection *conn);
  void reap_finished();
  void deliver(ClipboardMessage message);

  Result<void> send(const DeviceId &peer_id, const ClipboardMessage &message);
  BroadcastReport send_to_all(const ClipboardMessage &message);

  Result<std::shared_ptr<OutboundConnection>>
  acquire(const DeviceId &peer_id, const DeviceInfo &peer);
  void drop(const DeviceId &peer_id,
            const std::shared_ptr<OutboundConnection> &conn);
};

Result<void> TransportManager::Impl::bind_listener() {
  sockaddr_in addr{};
  auto base = net::make_address(config.bind_address, 0);
  if (base.is_error()) {
    return Error(ErrorCode::BindFailed, base.error().message);
  }
  addr = base.value();

  uint32_t last = std::min<uint32_t>(
      static_cast<uint32_t>(config.base_port) + config.port_scan_limit, 65536);

  for (uint32_t candidate = config.base_port; candidate < last; ++candidate) {
    net::Socket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock) {
      return net::socket_error(ErrorCode::BindFailed,
                               "Failed to create TCP socket");
    }

    int reuse = 1;
    if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &reuse,
                     sizeof(reuse)) < 0) {
      CLIPSYNC_LOG_WARN(TAG, "Failed to set SO_REUSEADDR: " +
                                 net::errno_string());
    }

    addr.sin_port = htons(static_cast<uint16_t>(candidate));
    if (::bind(sock.get(), reinterpret_cast<sockaddr *>(&addr),
               sizeof(addr)) < 0) {
      CLIPSYNC_LOG_DEBUG(TAG, "Port " + std::to_string(candidate) +
                                  " unavailable: " + net::errno_string());
      continue;
    }

    if (::listen(sock.get(), LISTEN_BACKLOG) < 0) {
      CLIPSYNC_LOG_DEBUG(TAG, "listen on port " + std::to_string(candidate) +
                                  " failed: " + net::errno_string());
      continue;
    }

    listen_socket = std::move(sock);
    port.store(static_cast<uint16_t>(candidate));
    return Result<void>::ok();
  }

  return Error(ErrorCode::BindFailed, "No free TCP port",
               std::to_string(config.base_port) + ".." +
                   std::to_string(last - 1));
}

void TransportManager::Impl::accept_loop() {
  while (running.load()) {
    reap_finished();

    int ready =
        net::wait_for(listen_socket.get(), POLLIN, config.poll_timeout);
    if (ready <= 0) {
      continue;
    }

    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    int fd = ::accept4(listen_socket.get(), reinterpret_cast<sockaddr *>(&from),
                       &from_len, SOCK_CLOEXEC);
    if (fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        CLIPSYNC_LOG_WARN(TAG, "accept failed: " + net::errno_string());
      }
      continue;
    }

    auto conn = std::make_unique<InboundConnection>();
    conn->socket = net::Socket(fd);
    conn->peer = net::address_to_string(from) + ":" +
                 std::to_string(ntohs(from.sin_port));
    ++connections_accepted;
    CLIPSYNC_LOG_DEBUG(TAG, "Accepted connection from " + conn->peer);

    InboundConnection *raw = conn.get();
    std::lock_guard<std::mutex> lock(inbound_mutex);
    inbound.push_back(std::move(conn));
    raw->thread = std::thread([this, raw] { read_loop(raw); });
  }
}

void TransportManager::Impl::read_loop(InboundConnection *conn) {
  FrameDecoder decoder(config.max_frame_size);
  Bytes buffer(READ_BUFFER_SIZE);
  int fd = conn->socket.get();

  while (running.load()) {
    int ready = net::wait_for(fd, POLLIN, config.poll_timeout);
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      break;
    }

    ssize_t n = ::recv(fd, buffer.data(), buffer.size(), MSG_DONTWAIT);
    if (n == 0) {
      CLIPSYNC_LOG_DEBUG(TAG, "Connection closed by " + conn->peer);
      break;
    }
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
        continue;
      }
      CLIPSYNC_LOG_DEBUG(TAG, "recv from " + conn->peer +
                                  " failed: " + net::errno_string());
      break;
    }

    auto frames = decoder.feed(buffer.data(), static_cast<size_t>(n));
    if (frames.is_error()) {
      ++frame_errors;
      CLIPSYNC_LOG_WARN(TAG, "Closing connection from " + conn->peer + ": " +
                                 frames.error().to_string());
      break;
    }

    bool bad_payload = false;
    for (const auto &payload : frames.value()) {
      auto message = parse_clipboard_message(payload);
      if (message.is_error()) {
        ++frame_errors;
        CLIPSYNC_LOG_WARN(TAG, "Closing connection from " + conn->peer +
                                   ": " + message.error().to_string());
        bad_payload = true;
        break;
      }
      ++messages_received;
      deliver(std::move(message).value());
    }
    if (bad_payload) {
      break;
    }
  }

  // The fd itself is closed when the connection is reaped
  ::shutdown(fd, SHUT_RDWR);
  conn->finished.store(true);
}

void TransportManager::Impl::reap_finished() {
  std::list<std::unique_ptr<InboundConnection>> done;
  {
    std::lock_guard<std::mutex> lock(inbound_mutex);
    for (auto it = inbound.begin(); it != inbound.end();) {
      if ((*it)->finished.load()) {
        done.push_back(std::move(*it));
        it = inbound.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto &conn : done) {
    if (conn->thread.joinable()) {
      conn->thread.join();
    }
  }
}

void TransportManager::Impl::outbound_loop() {
  while (true) {
    ClipboardMessage message;
    {
      std::unique_lock<std::mutex> lock(outbound_mutex);
      outbound_cv.wait(lock,
                       [this] { return !running.load() || !outbound.empty(); });
      if (!running.load()) {
        return;
      }
      message = std::move(outbound.front());
      outbound.pop_front();
    }

    auto report = send_to_all(message);
    CLIPSYNC_LOG_DEBUG(TAG, "Broadcast " + message.message_id.to_string() +
                                ": " + std::to_string(report.delivered.size()) +
                                "/" + std::to_string(report.attempted()) +
                                " delivered");

    BroadcastObserver cb;
    {
      std::lock_guard<std::mutex> lock(handler_mutex);
      cb = observer;
    }
    if (cb) {
      cb(message, report);
    }
  }
}

void TransportManager::Impl::deliver(ClipboardMessage message) {
  MessageHandler cb;
  {
    std::lock_guard<std::mutex> lock(handler_mutex);
    cb = handler;
  }
  if (cb) {
    cb(std::move(message));
  } else {
    CLIPSYNC_LOG_DEBUG(TAG, "No message handler; message dropped");
  }
}

Result<std::shared_ptr<OutboundConnection>>
TransportManager::Impl::acquire(const DeviceId &peer_id,
                                const DeviceInfo &peer) {
  {
    std::lock_guard<std::mutex> lock(pool_mutex);
    auto it = pool.find(peer_id);
    if (it != pool.end()) {
      auto conn = it->second;
      bool moved = conn->address != peer.address || conn->port != peer.port;
      if (!moved && !peer_closed(conn->socket.get())) {
        return conn;
      }
      pool.erase(it);
      CLIPSYNC_LOG_DEBUG(TAG, "Discarding stale connection to " + peer.name);
    }
  }

  // Connect without holding the pool lock
  auto sock = net::connect_with_timeout(peer.address, peer.port,
                                        config.connect_timeout);
  if (sock.is_error()) {
    return sock.error();
  }

  auto conn = std::make_shared<OutboundConnection>();
  conn->socket = std::move(sock).value();
  conn->address = peer.address;
  conn->port = peer.port;
  ++connections_opened;
  CLIPSYNC_LOG_DEBUG(TAG, "Connected to " + peer.name + " at " +
                              peer.address + ":" + std::to_string(peer.port));

  std::lock_guard<std::mutex> lock(pool_mutex);
  auto [it, inserted] = pool.emplace(peer_id, conn);
  if (!inserted) {
    // Another sender connected first; keep theirs
    return it->second;
  }
  return conn;
}

void TransportManager::Impl::drop(
    const DeviceId &peer_id, const std::shared_ptr<OutboundConnection> &conn) {
  std::lock_guard<std::mutex> lock(pool_mutex);
  auto it = pool.find(peer_id);
  if (it != pool.end() && it->second == conn) {
    pool.erase(it);
  }
}

Result<void> TransportManager::Impl::send(const DeviceId &peer_id,
                                          const ClipboardMessage &message) {
  auto peer = registry.get(peer_id);
  if (!peer) {
    ++send_failures;
    return Error(ErrorCode::PeerNotFound,
                 "Unknown peer " + peer_id.to_string());
  }

  auto frame = frame_clipboard_message(message, config.max_frame_size);
  if (frame.is_error()) {
    ++send_failures;
    return frame.error();
  }

  auto conn = acquire(peer_id, *peer);
  if (conn.is_error()) {
    ++send_failures;
    return conn.error();
  }

  const auto &c = conn.value();
  Result<void> written;
  {
    std::lock_guard<std::mutex> lock(c->write_mutex);
    written = net::write_all(c->socket.get(), frame.value().data(),
                             frame.value().size(),
                             config.write_timeout);
  }

  if (written.is_error()) {
    drop(peer_id, c);
    ++send_failures;
    return Error(ErrorCode::ConnectionLost,
                 "Write to " + peer->name + " failed",
                 written.error().to_string());
  }

  ++messages_sent;
  return Result<void>::ok();
}

BroadcastReport
TransportManager::Impl::send_to_all(const ClipboardMessage &message) {
  BroadcastReport report;

  for (const auto &peer : registry.snapshot()) {
    auto result = send(peer.id, message);
    if (result.is_ok()) {
      report.delivered.push_back(peer.id);
    } else {
      CLIPSYNC_LOG_WARN(TAG, "Send to " + peer.name + " failed: " +
                                 result.error().to_string());
      report.failures.push_back({peer.id, result.error()});
    }
  }

  return report;
}

// ============================================================================
// TransportManager
// ============================================================================

TransportManager::TransportManager(DeviceRegistry &registry,
                                   TransportConfig config)
    : impl_(std::make_unique<Impl>(registry, std::move(config))) {}

TransportManager::~TransportManager() { stop(); }

Result<void> TransportManager::start() {
  if (impl_->running.load()) {
    return Error(ErrorCode::AlreadyInitialized, "Transport already running");
  }

  CLIPSYNC_TRY(impl_->bind_listener());

  impl_->running.store(true);
  impl_->accept_thread = std::thread([this] { impl_->accept_loop(); });
  impl_->outbound_thread = std::thread([this] { impl_->outbound_loop(); });

  CLIPSYNC_LOG_INFO(TAG, "Listening on port " +
                             std::to_string(impl_->port.load()));
  return Result<void>::ok();
}

void TransportManager::stop() {
  if (!impl_->running.exchange(false)) {
    return;
  }

  // Lock before notifying so the outbound task cannot miss the wakeup
  size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(impl_->outbound_mutex);
    discarded = impl_->outbound.size();
    impl_->outbound.clear();
  }
  impl_->outbound_cv.notify_all();
  if (impl_->outbound_thread.joinable()) {
    impl_->outbound_thread.join();
  }
  if (discarded > 0) {
    CLIPSYNC_LOG_DEBUG(TAG, "Discarded " + std::to_string(discarded) +
                                " queued broadcasts");
  }

  if (impl_->accept_thread.joinable()) {
    impl_->accept_thread.join();
  }
  impl_->listen_socket.close();

  std::list<std::unique_ptr<InboundConnection>> inbound;
  {
    std::lock_guard<std::mutex> lock(impl_->inbound_mutex);
    inbound.swap(impl_->inbound);
  }
  for (auto &conn : inbound) {
    conn->socket.shutdown_both();
  }
  for (auto &conn : inbound) {
    if (conn->thread.joinable()) {
      conn->thread.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(impl_->pool_mutex);
    impl_->pool.clear();
  }

  impl_->port.store(0);
  CLIPSYNC_LOG_INFO(TAG, "Transport stopped");
}

bool TransportManager::is_running() const { return impl_->running.load(); }

uint16_t TransportManager::listening_port() const {
  return impl_->port.load();
}

void TransportManager::set_message_handler(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(impl_->handler_mutex);
  impl_->handler = std::move(handler);
}

Result<void> TransportManager::send(const DeviceId &peer_id,
                                    const ClipboardMessage &message) {
  return impl_->send(peer_id, message);
}

BroadcastReport TransportManager::send_to_all(const ClipboardMessage &message) {
  return impl_->send_to_all(message);
}

Result<void> TransportManager::enqueue_broadcast(ClipboardMessage message) {
  if (!impl_->running.load()) {
    return Error(ErrorCode::NotInitialized, "Transport not running");
  }

  {
    std::lock_guard<std::mutex> lock(impl_->outbound_mutex);
    while (impl_->outbound.size() >= impl_->config.broadcast_queue_limit &&
           !impl_->outbound.empty()) {
      CLIPSYNC_LOG_WARN(TAG, "Outbound queue full; dropping broadcast " +
                                 impl_->outbound.front().message_id.to_string());
      impl_->outbound.pop_front();
      ++impl_->broadcasts_dropped;
    }
    impl_->outbound.push_back(std::move(message));
    ++impl_->broadcasts_queued;
  }
  impl_->outbound_cv.notify_one();
  return Result<void>::ok();
}

void TransportManager::set_broadcast_observer(BroadcastObserver observer) {
  std::lock_guard<std::mutex> lock(impl_->handler_mutex);
  impl_->observer = std::move(observer);
}

size_t TransportManager::pending_broadcasts() const {
  std::lock_guard<std::mutex> lock(impl_->outbound_mutex);
  return impl_->outbound.size();
}

size_t TransportManager::prune_connections() {
  std::lock_guard<std::mutex> lock(impl_->pool_mutex);

  size_t pruned = 0;
  for (auto it = impl_->pool.begin(); it != impl_->pool.end();) {
    if (!impl_->registry.contains(it->first)) {
      it = impl_->pool.erase(it);
      ++pruned;
    } else {
      ++it;
    }
  }
  return pruned;
}

void TransportManager::disconnect(const DeviceId &peer_id) {
  std::lock_guard<std::mutex> lock(impl_->pool_mutex);
  impl_->pool.erase(peer_id);
}

size_t TransportManager::outbound_connection_count() const {
  std::lock_guard<std::mutex> lock(impl_->pool_mutex);
  return impl_->pool.size();
}

size_t TransportManager::inbound_connection_count() const {
  std::lock_guard<std::mutex> lock(impl_->inbound_mutex);
  size_t active = 0;
  for (const auto &conn : impl_->inbound) {
    if (!conn->finished.load()) {
      ++active;
    }
  }
  return active;
}

TransportStats TransportManager::get_stats() const {
  TransportStats stats;
  stats.connections_accepted = impl_->connections_accepted.load();
  stats.connections_opened = impl_->connections_opened.load();
  stats.messages_sent = impl_->messages_sent.load();
  stats.messages_received = impl_->messages_received.load();
  stats.send_failures = impl_->send_failures.load();
  stats.frame_errors = impl_->frame_errors.load();
  stats.broadcasts_queued = impl_->broadcasts_queued.load();
  stats.broadcasts_dropped = impl_->broadcasts_dropped.load();
  return stats;
}

const TransportConfig &TransportManager::config() const {
  return impl_->config;
}

} // namespace clipsync
