/**
 * @file log.cpp
 * @brief Logger implementation
 */

#include "clipsync/log.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace clipsync {

namespace {

uint64_t now_millis() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

void stderr_sink(const std::string &line) {
  std::fprintf(stderr, "%s\n", line.c_str());
}

} // namespace

// ============================================================================
// Log Level Names
// ============================================================================

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    return "OFF";
  default:
    return "UNKNOWN";
  }
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug")
    return LogLevel::Debug;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "warning" || lower == "warn")
    return LogLevel::Warning;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "off")
    return LogLevel::Off;
  return std::nullopt;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(size_t max_entries)
    : max_entries_(std::max<size_t>(1, max_entries)), sink_(stderr_sink) {}

void Logger::log(LogLevel level, std::string_view component,
                 std::string_view message) {
  if (level == LogLevel::Off) {
    return;
  }

  LogEntry entry{now_millis(), level, std::string(component),
                 std::string(message)};
  LogSink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) {
      return;
    }

    if (entries_.size() >= max_entries_) {
      entries_.pop_front();
    }
    entries_.push_back(entry);
    sink = sink_;
  }

  // Sink runs unlocked
  if (sink) {
    sink(format(entry));
  }
}

void Logger::debug(std::string_view component, std::string_view message) {
  log(LogLevel::Debug, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
  log(LogLevel::Info, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
  log(LogLevel::Warning, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
  log(LogLevel::Error, component, message);
}

std::vector<LogEntry> Logger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

size_t Logger::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void Logger::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

void Logger::set_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level != LogLevel::Off && level >= level_;
}

void Logger::set_max_entries(size_t max_entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  max_entries_ = std::max<size_t>(1, max_entries);
  while (entries_.size() > max_entries_) {
    entries_.pop_front();
  }
}

size_t Logger::max_entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return max_entries_;
}

void Logger::set_sink(LogSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::reset_sink() { set_sink(stderr_sink); }

std::string Logger::format(const LogEntry &entry) {
  std::time_t secs = static_cast<std::time_t>(entry.timestamp_ms / 1000);
  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);

  char stamp[32];
  size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
  std::snprintf(stamp + n, sizeof(stamp) - n, ".%03u",
                static_cast<unsigned>(entry.timestamp_ms % 1000));

  std::string formatted;
  formatted.reserve(48 + entry.component.size() + entry.message.size());
  formatted.append("[");
  formatted.append(stamp);
  formatted.append("] [");
  formatted.append(log_level_name(entry.level));
  formatted.append("] [");
  formatted.append(entry.component);
  formatted.append("] ");
  formatted.append(entry.message);
  return formatted;
}

Logger &logger() {
  static Logger instance;
  return instance;
}

} // namespace clipsync
