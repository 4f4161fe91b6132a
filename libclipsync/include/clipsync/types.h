/**
 * @file types.h
 * @brief Core type definitions for ClipSync
 */

#ifndef CLIPSYNC_TYPES_H
#define CLIPSYNC_TYPES_H

#include "platform.h"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace clipsync {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Wall-clock time; travels on the wire as milliseconds since the epoch
using Timestamp = std::chrono::system_clock::time_point;

/// Convert a timestamp to milliseconds since the Unix epoch
CLIPSYNC_API uint64_t to_millis(Timestamp ts);

/// Convert milliseconds since the Unix epoch to a timestamp
CLIPSYNC_API Timestamp from_millis(uint64_t ms);

/// Visitor built from one lambda per alternative, for std::visit
template <typename... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

// ============================================================================
// Identifiers
// ============================================================================

/// Random 128-bit identifier (RFC 4122 version 4 layout)
struct Uuid {
  static constexpr size_t SIZE = 16;
  std::array<Byte, SIZE> data{};

  bool operator==(const Uuid &other) const { return data == other.data; }
  bool operator!=(const Uuid &other) const { return data != other.data; }
  bool operator<(const Uuid &other) const { return data < other.data; }

  /// Canonical lower-case hyphenated form (8-4-4-4-12)
  std::string to_string() const;
  static std::optional<Uuid> from_string(const std::string &str);

  /// Generate a fresh random identifier (uses libsodium)
  static Uuid generate();

  bool is_zero() const;
};

/// Identifies one running ClipSync instance
using DeviceId = Uuid;

/// Identifies one logical clipboard change; the deduplication key
using MessageId = Uuid;

// ============================================================================
// Device Information
// ============================================================================

/// A peer as known to the device registry
struct DeviceInfo {
  DeviceId id;
  std::string name;
  std::string address; // IPv4 dotted quad
  uint16_t port = 0;   // TCP listening port
  Timestamp last_seen;
};

// ============================================================================
// Discovery Messages
// ============================================================================

/// Periodic presence broadcast to the multicast group
struct Announcement {
  DeviceInfo device;
};

/// Unicast reply to an announcement
struct Response {
  DeviceInfo device;
};

/// Sent once on graceful shutdown
struct Goodbye {
  DeviceInfo device;
};

using DiscoveryMessage = std::variant<Announcement, Response, Goodbye>;

/// Device carried by any discovery message
CLIPSYNC_API const DeviceInfo &discovery_device(const DiscoveryMessage &msg);

/// Get human-readable name for the message kind
CLIPSYNC_API const char *discovery_kind_name(const DiscoveryMessage &msg);

// ============================================================================
// Clipboard Content
// ============================================================================

/// Kind of content currently on a clipboard
enum class ContentType : uint8_t { Empty = 0, Text = 1, Image = 2 };

/**
 * @brief Get human-readable name for content type
 */
CLIPSYNC_API const char *content_type_name(ContentType type);

struct TextContent {
  std::string text;

  bool operator==(const TextContent &other) const {
    return text == other.text;
  }
  bool operator!=(const TextContent &other) const { return !(*this == other); }
};

/// PNG-encoded image with its dimensions
struct ImageContent {
  uint32_t width = 0;
  uint32_t height = 0;
  Bytes bytes;

  bool operator==(const ImageContent &other) const {
    return width == other.width && height == other.height &&
           bytes == other.bytes;
  }
  bool operator!=(const ImageContent &other) const { return !(*this == other); }
};

using ClipboardContent = std::variant<TextContent, ImageContent>;

/// Text or Image, never Empty
CLIPSYNC_API ContentType content_type_of(const ClipboardContent &content);

/// True for empty text or an image without bytes
CLIPSYNC_API bool is_empty(const ClipboardContent &content);

/**
 * @brief Copy of @p text with every invalid UTF-8 byte replaced by U+FFFD
 *
 * Overlong forms, surrogates and code points above U+10FFFF count as
 * invalid.
 */
CLIPSYNC_API std::string sanitize_utf8(const std::string &text);

/**
 * @brief Short human-readable description of clipboard content
 *
 * Images render as "Image WxH". Text is sanitized with sanitize_utf8(), cut
 * after @p max_chars code points and gets a trailing "..." when it was
 * longer.
 */
CLIPSYNC_API std::string preview(const ClipboardContent &content,
                                 size_t max_chars = 50);

// ============================================================================
// Clipboard Message
// ============================================================================

/// One clipboard change as exchanged between peers
struct ClipboardMessage {
  ClipboardContent content;
  Timestamp timestamp;
  DeviceId sender_id;
  std::string sender_name;
  MessageId message_id;
};

// ============================================================================
// Callbacks
// ============================================================================

using DeviceAddedCallback = std::function<void(const DeviceInfo &device)>;
using DeviceRemovedCallback = std::function<void(const DeviceId &id)>;
using MessageHandler = std::function<void(ClipboardMessage message)>;

} // namespace clipsync

#endif // CLIPSYNC_TYPES_H
