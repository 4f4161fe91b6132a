/**
 * @file notification.h
 * @brief Desktop notifications
 */

#ifndef CLIPSYNC_NOTIFICATION_H
#define CLIPSYNC_NOTIFICATION_H

#include "error.h"
#include "platform.h"
#include <cstddef>
#include <memory>
#include <string>

namespace clipsync {

/**
 * @brief Fire-and-forget desktop notification sink
 *
 * A failed notification is reported as NotificationFailed; callers log it
 * and carry on.
 */
class CLIPSYNC_API Notifier {
public:
  virtual ~Notifier() = default;

  virtual Result<void> notify(const std::string &title,
                              const std::string &body) = 0;
};

/**
 * @brief Runs another notifier on a task of its own
 *
 * notify() queues the notification and returns at once, so a slow
 * notification daemon never holds up the caller. Failures of the wrapped
 * notifier are logged.
 */
class CLIPSYNC_API AsyncNotifier : public Notifier {
public:
  explicit AsyncNotifier(std::unique_ptr<Notifier> inner,
                         size_t queue_limit = 8);
  ~AsyncNotifier() override;

  // Non-copyable
  AsyncNotifier(const AsyncNotifier &) = delete;
  AsyncNotifier &operator=(const AsyncNotifier &) = delete;

  /**
   * @brief Queue a notification
   * @return NotificationFailed if queue_limit notifications are waiting
   */
  Result<void> notify(const std::string &title,
                      const std::string &body) override;

  /// Wait until every queued notification has been handed on
  void flush();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Create a notifier talking to the desktop notification daemon
 *
 * Uses org.freedesktop.Notifications on the D-Bus session bus. The bus
 * connection is opened lazily on the first notify().
 *
 * @param app_name Application name shown by the notification daemon
 */
CLIPSYNC_API std::unique_ptr<Notifier>
create_desktop_notifier(const std::string &app_name = "ClipSync");

} // namespace clipsync

#endif // CLIPSYNC_NOTIFICATION_H
