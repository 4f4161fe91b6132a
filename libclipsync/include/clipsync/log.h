/**
 * @file log.h
 * @brief Leveled component logger for ClipSync
 *
 * Every entry carries a component tag ("discovery", "transport", "sync",
 * ...). Formatted lines go to a replaceable sink, stderr by default, and
 * the most recent entries are kept in a bounded ring for inspection.
 */

#ifndef CLIPSYNC_LOG_H
#define CLIPSYNC_LOG_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clipsync {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Warning = 2,
  Error = 3,
  Off = 4 // Suppresses everything
};

/**
 * @brief Get upper-case name for log level
 */
CLIPSYNC_API const char *log_level_name(LogLevel level);

/**
 * @brief Parse a level name ("debug", "info", "warning"/"warn", "error",
 * "off"), case-insensitive
 */
CLIPSYNC_API std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Logger
// ============================================================================

struct LogEntry {
  uint64_t timestamp_ms = 0;
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

using LogSink = std::function<void(const std::string &line)>;

class CLIPSYNC_API Logger {
public:
  explicit Logger(size_t max_entries = 500);

  // Non-copyable
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void log(LogLevel level, std::string_view component,
           std::string_view message);
  void debug(std::string_view component, std::string_view message);
  void info(std::string_view component, std::string_view message);
  void warning(std::string_view component, std::string_view message);
  void error(std::string_view component, std::string_view message);

  /// Copy of the retained entries, oldest first
  std::vector<LogEntry> entries() const;
  size_t size() const;
  void clear();

  void set_level(LogLevel level);
  LogLevel level() const;
  bool enabled(LogLevel level) const;

  void set_max_entries(size_t max_entries);
  size_t max_entries() const;

  /// Replace the output sink; an empty function silences output
  void set_sink(LogSink sink);

  /// Restore the stderr sink
  void reset_sink();

  /// "[timestamp] [LEVEL] [component] message"
  static std::string format(const LogEntry &entry);

private:
  size_t max_entries_;
  std::deque<LogEntry> entries_;
  LogLevel level_ = LogLevel::Info;
  LogSink sink_;
  mutable std::mutex mutex_;
};

/// Process-wide logger
CLIPSYNC_API Logger &logger();

} // namespace clipsync

// ============================================================================
// Logging Macros
// ============================================================================

#define CLIPSYNC_LOG_DEBUG(component, message)                                 \
  do {                                                                         \
    if (::clipsync::logger().enabled(::clipsync::LogLevel::Debug)) {           \
      ::clipsync::logger().debug(component, message);                          \
    }                                                                          \
  } while (0)

#define CLIPSYNC_LOG_INFO(component, message)                                  \
  ::clipsync::logger().info(component, message)

#define CLIPSYNC_LOG_WARN(component, message)                                  \
  ::clipsync::logger().warning(component, message)

#define CLIPSYNC_LOG_ERROR(component, message)                                 \
  ::clipsync::logger().error(component, message)

#endif // CLIPSYNC_LOG_H
