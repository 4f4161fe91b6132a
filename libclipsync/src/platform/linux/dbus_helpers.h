/**
 * @file dbus_helpers.h
 * @brief D-Bus utility wrappers for the Linux platform layer
 */

#ifndef CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H
#define CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H

#include "clipsync/error.h"
#include <dbus/dbus.h>
#include <string>

namespace clipsync {
namespace platform {

// ============================================================================
// RAII Wrappers
// ============================================================================

/**
 * @brief Owning reference to a private DBusConnection
 *
 * Private connections must be closed before the last unref.
 */
class DBusConnectionRef {
public:
  DBusConnectionRef() = default;
  explicit DBusConnectionRef(DBusConnection *conn) : conn_(conn) {}
  ~DBusConnectionRef() { reset(); }

  DBusConnectionRef(DBusConnectionRef &&other) noexcept : conn_(other.conn_) {
    other.conn_ = nullptr;
  }

  DBusConnectionRef &operator=(DBusConnectionRef &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionRef(const DBusConnectionRef &) = delete;
  DBusConnectionRef &operator=(const DBusConnectionRef &) = delete;

  DBusConnection *get() const { return conn_; }
  explicit operator bool() const { return conn_ != nullptr; }

  void reset() {
    if (conn_) {
      dbus_connection_close(conn_);
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

private:
  DBusConnection *conn_ = nullptr;
};

/**
 * @brief Owning reference to a DBusMessage
 */
class DBusMessageRef {
public:
  explicit DBusMessageRef(DBusMessage *msg = nullptr) : msg_(msg) {}
  ~DBusMessageRef() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  DBusMessageRef(const DBusMessageRef &) = delete;
  DBusMessageRef &operator=(const DBusMessageRef &) = delete;

  DBusMessage *get() const { return msg_; }
  explicit operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

/**
 * @brief Scoped DBusError
 */
class DBusErrorScope {
public:
  DBusErrorScope() { dbus_error_init(&err_); }
  ~DBusErrorScope() { dbus_error_free(&err_); }

  DBusErrorScope(const DBusErrorScope &) = delete;
  DBusErrorScope &operator=(const DBusErrorScope &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }

  /// Convert to an Error with @p code, falling back to @p fallback text
  Error to_error(ErrorCode code, const std::string &fallback) const {
    if (!is_set()) {
      return Error(code, fallback);
    }
    std::string message = err_.name ? std::string(err_.name) : fallback;
    if (err_.message) {
      message += ": ";
      message += err_.message;
    }
    return Error(code, message);
  }

private:
  DBusError err_;
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Open a private connection to the session bus
 */
inline Result<DBusConnectionRef> open_session_bus() {
  DBusErrorScope error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SESSION, error.get());

  if (!conn || error.is_set()) {
    if (conn) {
      dbus_connection_close(conn);
      dbus_connection_unref(conn);
    }
    return error.to_error(ErrorCode::PlatformError,
                          "Cannot connect to session bus");
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return Result<DBusConnectionRef>(DBusConnectionRef(conn));
}

/**
 * @brief Send a method call and block for its reply
 */
inline Result<void> call_and_wait(DBusConnection *conn, DBusMessage *msg,
                                  int timeout_ms, ErrorCode code) {
  DBusErrorScope error;
  DBusMessageRef reply(dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get()));

  if (!reply || error.is_set()) {
    return error.to_error(code, "No reply from D-Bus peer");
  }
  return Result<void>::ok();
}

} // namespace platform
} // namespace clipsync

#endif // CLIPSYNC_PLATFORM_LINUX_DBUS_HELPERS_H
