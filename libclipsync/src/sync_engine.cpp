/**
 * @file sync_engine.cpp
 * @brief Sync engine implementation
 */

#include "clipsync/sync_engine.h"
#include "clipsync/log.h"
#include "clipsync/security.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <thread>

namespace clipsync {

namespace {

constexpr const char *TAG = "sync";

/**
 * @brief Message ids applied or sent recently, oldest first
 */
class RecentIds {
public:
  RecentIds(std::chrono::milliseconds retention, size_t capacity)
      : retention_(retention), capacity_(capacity) {}

  bool contains(const MessageId &id) const { return ids_.count(id) > 0; }

  void insert(const MessageId &id, Timestamp now) {
    expire(now);
    if (!ids_.insert(id).second) {
      return;
    }
    order_.emplace_back(id, now);
    while (order_.size() > capacity_) {
      ids_.erase(order_.front().first);
      order_.pop_front();
    }
  }

  void expire(Timestamp now) {
    while (!order_.empty() && now - order_.front().second > retention_) {
      ids_.erase(order_.front().first);
      order_.pop_front();
    }
  }

  size_t size() const { return order_.size(); }

private:
  std::chrono::milliseconds retention_;
  size_t capacity_;
  std::set<MessageId> ids_;
  std::deque<std::pair<MessageId, Timestamp>> order_;
};

} // namespace

// ============================================================================
// SyncEngine Implementation
// ============================================================================

class SyncEngine::Impl {
public:
  Impl(ClipboardAccess &cb, DeviceId id, std::string name, SyncConfig cfg)
      : clipboard(cb), local_id(id), local_name(std::move(name)),
        config(cfg), recent(cfg.dedup_retention, cfg.dedup_capacity) {}

  ClipboardAccess &clipboard;
  const DeviceId local_id;
  const std::string local_name;
  const SyncConfig config;

  BroadcastCallback broadcaster;
  Notifier *notifier = nullptr;

  // Serializes poll and apply
  mutable std::mutex state_mutex;
  std::optional<Hash> last_text_hash;
  std::optional<Hash> last_image_hash;
  bool baseline_taken = false;
  RecentIds recent;

  mutable std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::deque<ClipboardMessage> queue;

  std::atomic<bool> running{false};
  std::atomic<bool> stop_requested{false};
  std::thread worker;

  std::atomic<uint64_t> changes_broadcast{0};
  std::atomic<uint64_t> messages_applied{0};
  std::atomic<uint64_t> duplicates_dropped{0};
  std::atomic<uint64_t> echoes_dropped{0};
  std::atomic<uint64_t> access_errors{0};

  std::optional<Hash> &slot_for(ContentType type) {
    return type == ContentType::Image ? last_image_hash : last_text_hash;
  }

  Result<bool> apply(const ClipboardMessage &message);
  void drain_queue();
  Result<bool> poll_clipboard();
  void run();
};

Result<bool> SyncEngine::Impl::apply(const ClipboardMessage &message) {
  if (message.sender_id == local_id) {
    ++echoes_dropped;
    CLIPSYNC_LOG_DEBUG(TAG, "Dropped own message " +
                                message.message_id.to_string());
    return false;
  }

  if (is_empty(message.content)) {
    return Error(ErrorCode::InvalidArgument, "Message carries no content");
  }

  auto content_hash = hash_content(message.content);
  if (content_hash.is_error()) {
    return content_hash.error();
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex);
    auto now = std::chrono::system_clock::now();
    recent.expire(now);

    if (recent.contains(message.message_id)) {
      ++duplicates_dropped;
      CLIPSYNC_LOG_DEBUG(TAG, "Dropped duplicate message " +
                                  message.message_id.to_string());
      return false;
    }

    auto written = clipboard.write(message.content);
    if (written.is_error()) {
      ++access_errors;
      CLIPSYNC_LOG_WARN(TAG, "Failed to apply message from " +
                                 message.sender_name + ": " +
                                 written.error().to_string());
      return Error(ErrorCode::ClipboardAccessError,
                   written.error().message);
    }

    slot_for(content_type_of(message.content)) = content_hash.value();
    recent.insert(message.message_id, now);
  }

  ++messages_applied;
  CLIPSYNC_LOG_INFO(TAG, "Applied " +
                             std::string(content_type_name(
                                 content_type_of(message.content))) +
                             " from " + message.sender_name);

  if (notifier && config.notifications) {
    auto shown = notifier->notify(
        "Clipboard synced",
        preview(message.content, config.preview_chars) + " (from " +
            sanitize_utf8(message.sender_name) + ")");
    if (shown.is_error()) {
      CLIPSYNC_LOG_DEBUG(TAG, "Notification failed: " +
                                  shown.error().to_string());
    }
  }
  return true;
}

void SyncEngine::Impl::drain_queue() {
  std::deque<ClipboardMessage> pending;
  {
    std::lock_guard<std::mutex> lock(queue_mutex);
    pending.swap(queue);
  }

  for (const auto &message : pending) {
    auto applied = apply(message);
    if (applied.is_error()) {
      CLIPSYNC_LOG_DEBUG(TAG, "Inbound message not applied: " +
                                  applied.error().to_string());
    }
  }
}

Result<bool> SyncEngine::Impl::poll_clipboard() {
  std::optional<ClipboardMessage> change;
  {
    std::lock_guard<std::mutex> lock(state_mutex);

    auto type = clipboard.content_type();
    if (type.is_error()) {
      ++access_errors;
      return Error(ErrorCode::ClipboardAccessError, type.error().message);
    }
    if (type.value() == ContentType::Empty) {
      baseline_taken = true;
      return false;
    }

    auto content = clipboard.read_as(type.value());
    if (content.is_error()) {
      if (content.error().code == ErrorCode::ClipboardEmpty) {
        baseline_taken = true;
        return false;
      }
      ++access_errors;
      return Error(ErrorCode::ClipboardAccessError, content.error().message);
    }
    if (is_empty(content.value())) {
      baseline_taken = true;
      return false;
    }

    auto content_hash = hash_content(content.value());
    if (content_hash.is_error()) {
      return content_hash.error();
    }

    auto &slot = slot_for(content_type_of(content.value()));
    if (slot && *slot == content_hash.value()) {
      baseline_taken = true;
      return false;
    }
    slot = content_hash.value();

    if (!baseline_taken) {
      baseline_taken = true;
      CLIPSYNC_LOG_DEBUG(TAG, "Adopted current clipboard as baseline");
      return false;
    }

    ClipboardMessage message;
    message.content = std::move(content).value();
    message.timestamp = std::chrono::system_clock::now();
    message.sender_id = local_id;
    message.sender_name = local_name;
    message.message_id = Uuid::generate();
    recent.insert(message.message_id, message.timestamp);
    change = std::move(message);
  }

  ++changes_broadcast;
  CLIPSYNC_LOG_INFO(TAG, "Local change: " +
                             preview(change->content, config.preview_chars));
  if (broadcaster) {
    broadcaster(*change);
  }
  return true;
}

void SyncEngine::Impl::run() {
  auto next_poll = std::chrono::steady_clock::now();

  while (!stop_requested) {
    {
      std::unique_lock<std::mutex> lock(queue_mutex);
      queue_cv.wait_until(lock, next_poll, [this] {
        return stop_requested.load() || !queue.empty();
      });
    }
    if (stop_requested) {
      break;
    }

    drain_queue();

    auto now = std::chrono::steady_clock::now();
    if (now >= next_poll) {
      auto polled = poll_clipboard();
      if (polled.is_error()) {
        CLIPSYNC_LOG_DEBUG(TAG, "Poll skipped: " + polled.error().to_string());
      }
      next_poll = now + config.poll_interval;
    }
  }
}

// ============================================================================
// SyncEngine Public Interface
// ============================================================================

SyncEngine::SyncEngine(ClipboardAccess &clipboard, DeviceId local_id,
                       std::string local_name, SyncConfig config)
    : impl_(std::make_unique<Impl>(clipboard, local_id, std::move(local_name),
                                   config)) {}

SyncEngine::~SyncEngine() { stop(); }

void SyncEngine::set_broadcaster(BroadcastCallback callback) {
  impl_->broadcaster = std::move(callback);
}

void SyncEngine::set_notifier(Notifier *notifier) {
  impl_->notifier = notifier;
}

Result<void> SyncEngine::start() {
  if (impl_->running) {
    return Error(ErrorCode::AlreadyInitialized, "Sync engine already running");
  }

  impl_->stop_requested = false;
  impl_->running = true;
  impl_->worker = std::thread([this] { impl_->run(); });

  CLIPSYNC_LOG_INFO(TAG, "Sync engine started (poll every " +
                             std::to_string(impl_->config.poll_interval.count()) +
                             " ms)");
  return Result<void>::ok();
}

void SyncEngine::stop() {
  if (!impl_->running) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    impl_->stop_requested = true;
    impl_->queue.clear();
  }
  impl_->queue_cv.notify_all();

  if (impl_->worker.joinable()) {
    impl_->worker.join();
  }
  impl_->running = false;
  CLIPSYNC_LOG_INFO(TAG, "Sync engine stopped");
}

bool SyncEngine::is_running() const { return impl_->running; }

void SyncEngine::enqueue(ClipboardMessage message) {
  {
    std::lock_guard<std::mutex> lock(impl_->queue_mutex);
    impl_->queue.push_back(std::move(message));
  }
  impl_->queue_cv.notify_one();
}

Result<bool> SyncEngine::apply(const ClipboardMessage &message) {
  return impl_->apply(message);
}

Result<bool> SyncEngine::poll_once() {
  impl_->drain_queue();
  return impl_->poll_clipboard();
}

bool SyncEngine::was_applied(const MessageId &id) const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex);
  return impl_->recent.contains(id);
}

size_t SyncEngine::recent_count() const {
  std::lock_guard<std::mutex> lock(impl_->state_mutex);
  return impl_->recent.size();
}

size_t SyncEngine::pending_count() const {
  std::lock_guard<std::mutex> lock(impl_->queue_mutex);
  return impl_->queue.size();
}

SyncStats SyncEngine::get_stats() const {
  SyncStats stats;
  stats.changes_broadcast = impl_->changes_broadcast;
  stats.messages_applied = impl_->messages_applied;
  stats.duplicates_dropped = impl_->duplicates_dropped;
  stats.echoes_dropped = impl_->echoes_dropped;
  stats.access_errors = impl_->access_errors;
  return stats;
}

const DeviceId &SyncEngine::local_id() const { return impl_->local_id; }

const SyncConfig &SyncEngine::config() const { return impl_->config; }

} // namespace clipsync
