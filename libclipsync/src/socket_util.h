/**
 * @file socket_util.h
 * @brief POSIX socket helpers shared by discovery and transport
 *
 * Internal header, not installed.
 */

#ifndef CLIPSYNC_SOCKET_UTIL_H
#define CLIPSYNC_SOCKET_UTIL_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace clipsync {
namespace net {

// ============================================================================
// Socket RAII Wrapper
// ============================================================================

/**
 * @brief Owns a socket file descriptor
 */
class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {}

  ~Socket() { close(); }

  // Move-only
  Socket(Socket &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

  Socket &operator=(Socket &&other) noexcept {
    if (this != &other) {
      close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  explicit operator bool() const { return valid(); }

  /// Wake any thread blocked on this socket without releasing the fd
  void shutdown_both() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
};

// ============================================================================
// Helpers
// ============================================================================

inline std::string errno_string(int err = errno) { return std::strerror(err); }

inline Error socket_error(ErrorCode code, const std::string &what,
                          int err = errno) {
  return Error(code, what, errno_string(err));
}

inline Result<void> set_nonblocking(int fd, bool enabled) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return socket_error(ErrorCode::PlatformError, "fcntl(F_GETFL) failed");
  }
  flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (::fcntl(fd, F_SETFL, flags) < 0) {
    return socket_error(ErrorCode::PlatformError, "fcntl(F_SETFL) failed");
  }
  return Result<void>::ok();
}

/**
 * @brief Wait until @p fd has the requested events
 * @return >0 ready, 0 timed out, <0 error (EINTR is retried as a timeout)
 */
inline int wait_for(int fd, short events, std::chrono::milliseconds timeout) {
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = events;
  int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (rc < 0 && errno == EINTR) {
    return 0;
  }
  if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL)) &&
      !(pfd.revents & events)) {
    return -1;
  }
  return rc;
}

inline Result<sockaddr_in> make_address(const std::string &ip, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
    return Error(ErrorCode::InvalidArgument, "Invalid IPv4 address: " + ip);
  }
  return addr;
}

inline std::string address_to_string(const sockaddr_in &addr) {
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
  return std::string(buf);
}

/**
 * @brief Write a whole buffer to a blocking or non-blocking socket
 *
 * Each wait for writability is bounded by @p timeout.
 */
inline Result<void> write_all(int fd, const Byte *data, size_t length,
                              std::chrono::milliseconds timeout) {
  size_t sent = 0;
  while (sent < length) {
    ssize_t n = ::send(fd, data + sent, length - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int rc = wait_for(fd, POLLOUT, timeout);
      if (rc == 0) {
        return Error(ErrorCode::Timeout, "Socket write timed out");
      }
      if (rc < 0) {
        return socket_error(ErrorCode::ConnectionLost, "poll failed");
      }
      continue;
    }
    return socket_error(ErrorCode::ConnectionLost, "send failed");
  }
  return Result<void>::ok();
}

/**
 * @brief Connect over TCP with a bounded wait
 *
 * The returned socket is left in non-blocking mode.
 */
inline Result<Socket> connect_with_timeout(const std::string &ip,
                                           uint16_t port,
                                           std::chrono::milliseconds timeout) {
  auto addr = make_address(ip, port);
  if (addr.is_error()) {
    return addr.error();
  }

  Socket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock) {
    return socket_error(ErrorCode::ConnectionFailed, "socket() failed");
  }

  CLIPSYNC_TRY(set_nonblocking(sock.get(), true));

  const sockaddr_in &sa = addr.value();
  int rc = ::connect(sock.get(), reinterpret_cast<const sockaddr *>(&sa),
                     sizeof(sa));
  int connect_errno = errno;
  if (rc < 0 && connect_errno != EINPROGRESS) {
    return socket_error(ErrorCode::ConnectionFailed,
                        "connect to " + ip + ":" + std::to_string(port) +
                            " failed",
                        connect_errno);
  }

  if (rc < 0) {
    int ready = wait_for(sock.get(), POLLOUT, timeout);
    if (ready == 0) {
      return Error(ErrorCode::ConnectionTimeout,
                   "connect to " + ip + ":" + std::to_string(port) +
                       " timed out");
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      so_error = errno;
    }
    if (ready < 0 || so_error != 0) {
      return socket_error(ErrorCode::ConnectionFailed,
                          "connect to " + ip + ":" + std::to_string(port) +
                              " failed",
                          so_error != 0 ? so_error : ECONNREFUSED);
    }
  }

  return Result<Socket>(std::move(sock));
}

} // namespace net
} // namespace clipsync

#endif // CLIPSYNC_SOCKET_UTIL_H
