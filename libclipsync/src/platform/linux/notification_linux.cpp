/**
 * @file notification_linux.cpp
 * @brief Desktop notifications via org.freedesktop.Notifications
 */

#include "clipsync/notification.h"
#include "clipsync/types.h"
#include "dbus_helpers.h"
#include <cstdint>
#include <mutex>

namespace clipsync {
namespace platform {

namespace {

constexpr const char *NOTIFY_SERVICE = "org.freedesktop.Notifications";
constexpr const char *NOTIFY_PATH = "/org/freedesktop/Notifications";
constexpr const char *NOTIFY_INTERFACE = "org.freedesktop.Notifications";
constexpr int NOTIFY_CALL_TIMEOUT_MS = 1000;
constexpr int32_t NOTIFY_EXPIRE_MS = 4000;

} // namespace

class DBusNotifier : public Notifier {
public:
  explicit DBusNotifier(std::string app_name) : app_name_(std::move(app_name)) {}

  Result<void> notify(const std::string &title,
                      const std::string &body) override {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!bus_) {
      auto bus = open_session_bus();
      if (bus.is_error()) {
        return Error(ErrorCode::NotificationFailed, bus.error().message);
      }
      bus_ = std::move(bus).value();
    }

    DBusMessageRef msg(dbus_message_new_method_call(
        NOTIFY_SERVICE, NOTIFY_PATH, NOTIFY_INTERFACE, "Notify"));
    if (!msg) {
      return Error(ErrorCode::NotificationFailed,
                   "Failed to create D-Bus message");
    }

    // libdbus aborts the process on a STRING argument that is not UTF-8
    std::string safe_app = sanitize_utf8(app_name_);
    std::string safe_title = sanitize_utf8(title);
    std::string safe_body = sanitize_utf8(body);
    if (!dbus_validate_utf8(safe_app.c_str(), nullptr) ||
        !dbus_validate_utf8(safe_title.c_str(), nullptr) ||
        !dbus_validate_utf8(safe_body.c_str(), nullptr)) {
      return Error(ErrorCode::NotificationFailed,
                   "Notification text is not valid UTF-8");
    }

    const char *app = safe_app.c_str();
    dbus_uint32_t replaces_id = 0;
    const char *icon = "edit-paste";
    const char *summary = safe_title.c_str();
    const char *text = safe_body.c_str();
    dbus_int32_t expire = NOTIFY_EXPIRE_MS;

    DBusMessageIter iter, actions, hints;
    dbus_message_iter_init_append(msg.get(), &iter);

    // Notify(s app_name, u replaces_id, s icon, s summary, s body,
    //        as actions, a{sv} hints, i expire_timeout)
    bool ok = dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &app) &&
              dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32,
                                             &replaces_id) &&
              dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &icon) &&
              dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING,
                                             &summary) &&
              dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &text);
    ok = ok &&
         dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY,
                                          DBUS_TYPE_STRING_AS_STRING,
                                          &actions) &&
         dbus_message_iter_close_container(&iter, &actions);
    ok = ok &&
         dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}",
                                          &hints) &&
         dbus_message_iter_close_container(&iter, &hints);
    ok = ok &&
         dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &expire);

    if (!ok) {
      return Error(ErrorCode::NotificationFailed,
                   "Out of memory building notification");
    }

    auto sent = call_and_wait(bus_.get(), msg.get(), NOTIFY_CALL_TIMEOUT_MS,
                              ErrorCode::NotificationFailed);
    if (sent.is_error()) {
      // Reconnect on the next notification in case the bus went away
      bus_.reset();
      return sent;
    }
    return Result<void>::ok();
  }

private:
  std::string app_name_;
  std::mutex mutex_;
  DBusConnectionRef bus_;
};

} // namespace platform

std::unique_ptr<Notifier> create_desktop_notifier(const std::string &app_name) {
  return std::make_unique<platform::DBusNotifier>(app_name);
}

} // namespace clipsync
