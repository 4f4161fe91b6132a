/**
 * @file protocol.h
 * @brief ClipSync wire protocol definitions
 *
 * Two encodings share one magic and version:
 * - Discovery datagrams (UDP multicast/unicast), one message per datagram
 * - Clipboard messages (TCP), each wrapped in a frame with a 4-byte
 *   big-endian length prefix
 *
 * Multi-byte fields inside a payload are little-endian. Only the TCP frame
 * prefix is big-endian.
 */

#ifndef CLIPSYNC_PROTOCOL_H
#define CLIPSYNC_PROTOCOL_H

#include "clipsync/error.h"
#include "clipsync/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace clipsync {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Protocol magic number: "CLPS" in little-endian
constexpr uint32_t PROTOCOL_MAGIC = 0x53504C43;

/// Current protocol version
constexpr uint8_t PROTOCOL_VERSION = 1;

/// Largest discovery datagram accepted or produced
constexpr size_t MAX_DATAGRAM_SIZE = 1024;

/// Size of the TCP frame length prefix
constexpr size_t FRAME_HEADER_SIZE = 4;

/// Default ceiling on a frame's declared payload length (8 MiB)
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 8 * 1024 * 1024;

/// Longest string carried in a u16-prefixed field
constexpr size_t MAX_SHORT_STRING = 65535;

// ============================================================================
// Tags
// ============================================================================

enum class DiscoveryKind : uint8_t {
  Announcement = 1,
  Response = 2,
  Goodbye = 3
};

enum class ContentTag : uint8_t { Text = 1, Image = 2 };

// ============================================================================
// Discovery Datagrams
// ============================================================================

/**
 * @brief Serialize a discovery message
 *
 * Names and addresses longer than the u16 field allows are truncated.
 * Callers keep device names short enough for the result to fit in
 * MAX_DATAGRAM_SIZE.
 */
CLIPSYNC_API Bytes serialize_discovery(const DiscoveryMessage &msg);

/**
 * @brief Parse a discovery datagram
 * @return Message, or DiscoveryParseError when the datagram is oversized,
 *         truncated, carries a bad magic/version/kind, or has trailing bytes
 */
CLIPSYNC_API Result<DiscoveryMessage> parse_discovery(const Byte *data,
                                                      size_t length);
CLIPSYNC_API Result<DiscoveryMessage> parse_discovery(const Bytes &data);

// ============================================================================
// Clipboard Messages
// ============================================================================

/// Serialize a clipboard message payload (without frame prefix)
CLIPSYNC_API Bytes serialize_clipboard_message(const ClipboardMessage &msg);

/**
 * @brief Parse a clipboard message payload
 * @return Message, or FrameError when the payload is malformed
 */
CLIPSYNC_API Result<ClipboardMessage>
parse_clipboard_message(const Byte *data, size_t length);
CLIPSYNC_API Result<ClipboardMessage>
parse_clipboard_message(const Bytes &data);

// ============================================================================
// Framing
// ============================================================================

/// Prefix @p payload with its big-endian length
CLIPSYNC_API Bytes encode_frame(const Bytes &payload);

/// Read a big-endian frame length prefix
CLIPSYNC_API uint32_t read_frame_length(const Byte *prefix);

/**
 * @brief Serialize and frame a clipboard message
 * @return Frame bytes, or FrameTooLarge when the payload exceeds
 *         @p max_frame_size
 */
CLIPSYNC_API Result<Bytes>
frame_clipboard_message(const ClipboardMessage &msg,
                        uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

/**
 * @brief Reassembles frames from an arbitrarily split byte stream
 *
 * Bytes are buffered until a whole payload is present. The declared length
 * is checked as soon as the 4-byte prefix arrives, so an oversized frame is
 * rejected before any of its payload is read. After an error the decoder
 * stays failed until reset().
 *
 * Not thread-safe; each connection owns its decoder.
 */
class CLIPSYNC_API FrameDecoder {
public:
  explicit FrameDecoder(uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE);

  /**
   * @brief Append received bytes and extract complete payloads
   * @return Zero or more payloads in arrival order, or FrameError
   */
  Result<std::vector<Bytes>> feed(const Byte *data, size_t length);

  /// Bytes held that do not yet form a complete frame
  size_t buffered() const { return buffer_.size(); }

  bool failed() const { return failed_; }

  uint32_t max_frame_size() const { return max_frame_size_; }

  void reset();

private:
  uint32_t max_frame_size_;
  Bytes buffer_;
  bool failed_ = false;
};

} // namespace clipsync

#endif // CLIPSYNC_PROTOCOL_H
