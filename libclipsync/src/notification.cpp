/**
 * @file notification.cpp
 * @brief Queued notification delivery
 */

#include "clipsync/notification.h"
#include "clipsync/log.h"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <utility>

namespace clipsync {

namespace {
constexpr const char *TAG = "notify";
} // namespace

class AsyncNotifier::Impl {
public:
  Impl(std::unique_ptr<Notifier> n, size_t limit)
      : inner(std::move(n)), queue_limit(limit) {}

  std::unique_ptr<Notifier> inner;
  const size_t queue_limit;

  std::mutex mutex;
  std::condition_variable wake;
  std::condition_variable idle;
  std::deque<std::pair<std::string, std::string>> queue;
  bool busy = false;
  bool stopping = false;
  std::thread thread;

  void run();
};

void AsyncNotifier::Impl::run() {
  std::unique_lock<std::mutex> lock(mutex);
  while (true) {
    wake.wait(lock, [this] { return stopping || !queue.empty(); });
    // Anything still queued at shutdown is dropped
    if (stopping) {
      return;
    }

    auto [title, body] = std::move(queue.front());
    queue.pop_front();
    busy = true;
    lock.unlock();

    if (inner) {
      auto result = inner->notify(title, body);
      if (result.is_error()) {
        CLIPSYNC_LOG_DEBUG(TAG, "Notification not shown: " +
                                    result.error().to_string());
      }
    }

    lock.lock();
    busy = false;
    idle.notify_all();
  }
}

AsyncNotifier::AsyncNotifier(std::unique_ptr<Notifier> inner,
                             size_t queue_limit)
    : impl_(std::make_unique<Impl>(std::move(inner), queue_limit)) {
  impl_->thread = std::thread([this] { impl_->run(); });
}

AsyncNotifier::~AsyncNotifier() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->stopping = true;
  }
  impl_->wake.notify_all();
  if (impl_->thread.joinable()) {
    impl_->thread.join();
  }
}

Result<void> AsyncNotifier::notify(const std::string &title,
                                   const std::string &body) {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->queue.size() >= impl_->queue_limit) {
      return Error(ErrorCode::NotificationFailed, "Notification queue full");
    }
    impl_->queue.emplace_back(title, body);
  }
  impl_->wake.notify_one();
  return Result<void>::ok();
}

void AsyncNotifier::flush() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  impl_->idle.wait(lock,
                   [this] { return impl_->queue.empty() && !impl_->busy; });
}

} // namespace clipsync
