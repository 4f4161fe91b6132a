/**
 * @file protocol.cpp
 * @brief ClipSync wire protocol implementation
 */

#include "clipsync/protocol.h"
#include <algorithm>
#include <cstring>

namespace clipsync {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

// Write little-endian uint16
void write_u16(Bytes &buf, uint16_t val) {
  buf.push_back(static_cast<Byte>(val & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 8) & 0xFF));
}

// Write little-endian uint32
void write_u32(Bytes &buf, uint32_t val) {
  buf.push_back(static_cast<Byte>(val & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 8) & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 16) & 0xFF));
  buf.push_back(static_cast<Byte>((val >> 24) & 0xFF));
}

// Write little-endian uint64
void write_u64(Bytes &buf, uint64_t val) {
  for (int i = 0; i < 8; ++i) {
    buf.push_back(static_cast<Byte>((val >> (i * 8)) & 0xFF));
  }
}

// Write length-prefixed string (u16 length + chars)
void write_short_string(Bytes &buf, const std::string &str) {
  uint16_t len = static_cast<uint16_t>(std::min(str.size(), MAX_SHORT_STRING));
  write_u16(buf, len);
  buf.insert(buf.end(), str.begin(), str.begin() + len);
}

void write_uuid(Bytes &buf, const Uuid &id) {
  buf.insert(buf.end(), id.data.begin(), id.data.end());
}

void write_header(Bytes &buf) {
  write_u32(buf, PROTOCOL_MAGIC);
  buf.push_back(PROTOCOL_VERSION);
}

/**
 * @brief Bounds-checked little-endian cursor over a payload
 *
 * Any read past the end marks the reader failed; later reads return zero
 * values, so callers check ok() once after reading a whole record.
 */
class Reader {
public:
  Reader(const Byte *data, size_t length) : data_(data), length_(length) {}

  bool ok() const { return ok_; }
  size_t remaining() const { return length_ - offset_; }

  uint8_t u8() {
    if (!take(1))
      return 0;
    return data_[offset_ - 1];
  }

  uint16_t u16() {
    if (!take(2))
      return 0;
    const Byte *d = data_ + offset_ - 2;
    return static_cast<uint16_t>(d[0] | (d[1] << 8));
  }

  uint32_t u32() {
    if (!take(4))
      return 0;
    const Byte *d = data_ + offset_ - 4;
    return static_cast<uint32_t>(d[0]) | (static_cast<uint32_t>(d[1]) << 8) |
           (static_cast<uint32_t>(d[2]) << 16) |
           (static_cast<uint32_t>(d[3]) << 24);
  }

  uint64_t u64() {
    if (!take(8))
      return 0;
    const Byte *d = data_ + offset_ - 8;
    uint64_t result = 0;
    for (int i = 0; i < 8; ++i) {
      result |= static_cast<uint64_t>(d[i]) << (i * 8);
    }
    return result;
  }

  Uuid uuid() {
    Uuid id;
    if (take(Uuid::SIZE)) {
      std::memcpy(id.data.data(), data_ + offset_ - Uuid::SIZE, Uuid::SIZE);
    }
    return id;
  }

  std::string string(size_t len) {
    if (!take(len))
      return {};
    return std::string(reinterpret_cast<const char *>(data_ + offset_ - len),
                       len);
  }

  std::string short_string() { return string(u16()); }

  Bytes bytes(size_t len) {
    if (!take(len))
      return {};
    return Bytes(data_ + offset_ - len, data_ + offset_);
  }

private:
  bool take(size_t n) {
    if (!ok_ || n > length_ - offset_) {
      ok_ = false;
      return false;
    }
    offset_ += n;
    return true;
  }

  const Byte *data_;
  size_t length_;
  size_t offset_ = 0;
  bool ok_ = true;
};

DiscoveryKind kind_of(const DiscoveryMessage &msg) {
  return std::visit(
      Overloaded{
          [](const Announcement &) { return DiscoveryKind::Announcement; },
          [](const Response &) { return DiscoveryKind::Response; },
          [](const Goodbye &) { return DiscoveryKind::Goodbye; },
      },
      msg);
}

Error parse_error(const char *what) {
  return Error(ErrorCode::DiscoveryParseError, what);
}

Error frame_error(const char *what) {
  return Error(ErrorCode::FrameError, what);
}

} // namespace

// ============================================================================
// Discovery Datagrams
// ============================================================================

Bytes serialize_discovery(const DiscoveryMessage &msg) {
  const DeviceInfo &device = discovery_device(msg);

  Bytes buf;
  buf.reserve(64 + device.name.size() + device.address.size());

  write_header(buf);
  buf.push_back(static_cast<Byte>(kind_of(msg)));
  write_uuid(buf, device.id);
  write_short_string(buf, device.name);
  write_short_string(buf, device.address);
  write_u16(buf, device.port);
  write_u64(buf, to_millis(device.last_seen));

  return buf;
}

Result<DiscoveryMessage> parse_discovery(const Byte *data, size_t length) {
  if (length > MAX_DATAGRAM_SIZE) {
    return parse_error("Datagram too large");
  }

  Reader r(data, length);
  uint32_t magic = r.u32();
  uint8_t version = r.u8();
  uint8_t kind = r.u8();
  if (!r.ok()) {
    return parse_error("Datagram truncated");
  }
  if (magic != PROTOCOL_MAGIC) {
    return parse_error("Invalid magic number");
  }
  if (version != PROTOCOL_VERSION) {
    return parse_error("Unsupported protocol version");
  }

  DeviceInfo device;
  device.id = r.uuid();
  device.name = r.short_string();
  device.address = r.short_string();
  device.port = r.u16();
  device.last_seen = from_millis(r.u64());

  if (!r.ok()) {
    return parse_error("Datagram truncated");
  }
  if (r.remaining() != 0) {
    return parse_error("Trailing bytes after discovery message");
  }

  switch (static_cast<DiscoveryKind>(kind)) {
  case DiscoveryKind::Announcement:
    return DiscoveryMessage(Announcement{std::move(device)});
  case DiscoveryKind::Response:
    return DiscoveryMessage(Response{std::move(device)});
  case DiscoveryKind::Goodbye:
    return DiscoveryMessage(Goodbye{std::move(device)});
  default:
    return parse_error("Unknown discovery message kind");
  }
}

Result<DiscoveryMessage> parse_discovery(const Bytes &data) {
  return parse_discovery(data.data(), data.size());
}

// ============================================================================
// Clipboard Messages
// ============================================================================

Bytes serialize_clipboard_message(const ClipboardMessage &msg) {
  Bytes buf;

  write_header(buf);
  buf.push_back(static_cast<Byte>(std::visit(
      Overloaded{
          [](const TextContent &) { return ContentTag::Text; },
          [](const ImageContent &) { return ContentTag::Image; },
      },
      msg.content)));
  write_uuid(buf, msg.message_id);
  write_uuid(buf, msg.sender_id);
  write_u64(buf, to_millis(msg.timestamp));
  write_short_string(buf, msg.sender_name);

  std::visit(Overloaded{
                 [&buf](const TextContent &text) {
                   buf.reserve(buf.size() + 4 + text.text.size());
                   write_u32(buf, static_cast<uint32_t>(text.text.size()));
                   buf.insert(buf.end(), text.text.begin(), text.text.end());
                 },
                 [&buf](const ImageContent &image) {
                   buf.reserve(buf.size() + 12 + image.bytes.size());
                   write_u32(buf, image.width);
                   write_u32(buf, image.height);
                   write_u32(buf, static_cast<uint32_t>(image.bytes.size()));
                   buf.insert(buf.end(), image.bytes.begin(),
                              image.bytes.end());
                 },
             },
             msg.content);

  return buf;
}

Result<ClipboardMessage> parse_clipboard_message(const Byte *data,
                                                 size_t length) {
  Reader r(data, length);
  uint32_t magic = r.u32();
  uint8_t version = r.u8();
  uint8_t tag = r.u8();
  if (!r.ok()) {
    return frame_error("Payload truncated");
  }
  if (magic != PROTOCOL_MAGIC) {
    return frame_error("Invalid magic number");
  }
  if (version != PROTOCOL_VERSION) {
    return frame_error("Unsupported protocol version");
  }

  ClipboardMessage msg;
  msg.message_id = r.uuid();
  msg.sender_id = r.uuid();
  msg.timestamp = from_millis(r.u64());
  msg.sender_name = r.short_string();

  switch (static_cast<ContentTag>(tag)) {
  case ContentTag::Text: {
    uint32_t len = r.u32();
    msg.content = TextContent{r.string(len)};
    break;
  }
  case ContentTag::Image: {
    ImageContent image;
    image.width = r.u32();
    image.height = r.u32();
    uint32_t len = r.u32();
    image.bytes = r.bytes(len);
    msg.content = std::move(image);
    break;
  }
  default:
    return frame_error("Unknown content tag");
  }

  if (!r.ok()) {
    return frame_error("Payload truncated");
  }
  if (r.remaining() != 0) {
    return frame_error("Trailing bytes after clipboard message");
  }

  return msg;
}

Result<ClipboardMessage> parse_clipboard_message(const Bytes &data) {
  return parse_clipboard_message(data.data(), data.size());
}

// ============================================================================
// Framing
// ============================================================================

Bytes encode_frame(const Bytes &payload) {
  uint32_t len = static_cast<uint32_t>(payload.size());

  Bytes frame;
  frame.reserve(FRAME_HEADER_SIZE + payload.size());
  frame.push_back(static_cast<Byte>((len >> 24) & 0xFF));
  frame.push_back(static_cast<Byte>((len >> 16) & 0xFF));
  frame.push_back(static_cast<Byte>((len >> 8) & 0xFF));
  frame.push_back(static_cast<Byte>(len & 0xFF));
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

uint32_t read_frame_length(const Byte *prefix) {
  return (static_cast<uint32_t>(prefix[0]) << 24) |
         (static_cast<uint32_t>(prefix[1]) << 16) |
         (static_cast<uint32_t>(prefix[2]) << 8) |
         static_cast<uint32_t>(prefix[3]);
}

Result<Bytes> frame_clipboard_message(const ClipboardMessage &msg,
                                      uint32_t max_frame_size) {
  Bytes payload = serialize_clipboard_message(msg);
  if (payload.size() > max_frame_size) {
    return Error(ErrorCode::FrameTooLarge,
                 "Clipboard message exceeds frame size limit",
                 std::to_string(payload.size()) + " > " +
                     std::to_string(max_frame_size));
  }
  return encode_frame(payload);
}

// ============================================================================
// FrameDecoder
// ============================================================================

FrameDecoder::FrameDecoder(uint32_t max_frame_size)
    : max_frame_size_(max_frame_size) {}

Result<std::vector<Bytes>> FrameDecoder::feed(const Byte *data,
                                              size_t length) {
  if (failed_) {
    return Error(ErrorCode::InvalidState, "Frame decoder already failed");
  }

  buffer_.insert(buffer_.end(), data, data + length);

  std::vector<Bytes> frames;
  size_t offset = 0;
  while (buffer_.size() - offset >= FRAME_HEADER_SIZE) {
    uint32_t declared = read_frame_length(buffer_.data() + offset);
    if (declared > max_frame_size_) {
      failed_ = true;
      buffer_.clear();
      return Error(ErrorCode::FrameError,
                   "Declared frame length exceeds limit",
                   std::to_string(declared) + " > " +
                       std::to_string(max_frame_size_));
    }

    if (buffer_.size() - offset - FRAME_HEADER_SIZE < declared) {
      break; // Wait for the rest of the payload
    }

    auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(
                                       offset + FRAME_HEADER_SIZE);
    frames.emplace_back(begin, begin + declared);
    offset += FRAME_HEADER_SIZE + declared;
  }

  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
  return frames;
}

void FrameDecoder::reset() {
  buffer_.clear();
  failed_ = false;
}

} // namespace clipsync
