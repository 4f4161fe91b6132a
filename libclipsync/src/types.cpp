/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "clipsync/types.h"
#include "clipsync/security.h"
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace clipsync {

// ============================================================================
// Timestamps
// ============================================================================

uint64_t to_millis(Timestamp ts) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      ts.time_since_epoch());
  return ms.count() < 0 ? 0 : static_cast<uint64_t>(ms.count());
}

Timestamp from_millis(uint64_t ms) {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::milliseconds(static_cast<int64_t>(ms))));
}

// ============================================================================
// Uuid
// ============================================================================

std::string Uuid::to_string() const {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < SIZE; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::optional<Uuid> Uuid::from_string(const std::string &str) {
  if (str.length() != 36) {
    return std::nullopt;
  }

  Uuid id;
  size_t pos = 0;
  for (size_t i = 0; i < SIZE; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      if (str[pos] != '-') {
        return std::nullopt;
      }
      ++pos;
    }
    std::string byte_str = str.substr(pos, 2);
    char *end;
    unsigned long val = std::strtoul(byte_str.c_str(), &end, 16);
    if (end != byte_str.c_str() + 2 || val > 255) {
      return std::nullopt;
    }
    id.data[i] = static_cast<Byte>(val);
    pos += 2;
  }

  return id;
}

Uuid Uuid::generate() {
  Uuid id;
  random_fill(id.data.data(), SIZE);

  // Version 4, variant 10xx
  id.data[6] = static_cast<Byte>((id.data[6] & 0x0F) | 0x40);
  id.data[8] = static_cast<Byte>((id.data[8] & 0x3F) | 0x80);
  return id;
}

bool Uuid::is_zero() const {
  for (size_t i = 0; i < SIZE; ++i) {
    if (data[i] != 0)
      return false;
  }
  return true;
}

// ============================================================================
// Discovery Messages
// ============================================================================

const DeviceInfo &discovery_device(const DiscoveryMessage &msg) {
  return std::visit(
      [](const auto &m) -> const DeviceInfo & { return m.device; }, msg);
}

namespace {
struct KindName {
  const char *operator()(const Announcement &) const { return "Announcement"; }
  const char *operator()(const Response &) const { return "Response"; }
  const char *operator()(const Goodbye &) const { return "Goodbye"; }
};
} // namespace

const char *discovery_kind_name(const DiscoveryMessage &msg) {
  return std::visit(KindName{}, msg);
}

// ============================================================================
// Clipboard Content
// ============================================================================

const char *content_type_name(ContentType type) {
  switch (type) {
  case ContentType::Empty:
    return "Empty";
  case ContentType::Text:
    return "Text";
  case ContentType::Image:
    return "Image";
  default:
    return "Unknown";
  }
}

ContentType content_type_of(const ClipboardContent &content) {
  return std::visit(
      Overloaded{
          [](const TextContent &) { return ContentType::Text; },
          [](const ImageContent &) { return ContentType::Image; },
      },
      content);
}

bool is_empty(const ClipboardContent &content) {
  return std::visit(
      Overloaded{
          [](const TextContent &text) { return text.text.empty(); },
          [](const ImageContent &image) { return image.bytes.empty(); },
      },
      content);
}

namespace {

constexpr const char *REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at text[i], or 0
size_t utf8_sequence_length(const std::string &text, size_t i) {
  auto byte_at = [&text](size_t k) {
    return static_cast<unsigned char>(text[k]);
  };
  unsigned char lead = byte_at(i);

  size_t length;
  unsigned char min_second = 0x80;
  unsigned char max_second = 0xBF;
  if (lead < 0x80) {
    return 1;
  } else if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
    if (lead == 0xE0) {
      min_second = 0xA0; // overlong
    } else if (lead == 0xED) {
      max_second = 0x9F; // surrogates
    }
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
    if (lead == 0xF0) {
      min_second = 0x90; // overlong
    } else if (lead == 0xF4) {
      max_second = 0x8F; // above U+10FFFF
    }
  } else {
    return 0;
  }

  if (i + length > text.size()) {
    return 0;
  }
  unsigned char second = byte_at(i + 1);
  if (second < min_second || second > max_second) {
    return 0;
  }
  for (size_t k = 2; k < length; ++k) {
    if ((byte_at(i + k) & 0xC0) != 0x80) {
      return 0;
    }
  }
  return length;
}

// Byte offset just past the first max_chars code points
size_t utf8_prefix_length(const std::string &text, size_t max_chars) {
  size_t chars = 0;
  size_t i = 0;
  while (i < text.size()) {
    auto lead = static_cast<unsigned char>(text[i]);
    if ((lead & 0xC0) != 0x80) {
      if (chars == max_chars) {
        return i;
      }
      ++chars;
    }
    ++i;
  }
  return text.size();
}

} // namespace

std::string sanitize_utf8(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    size_t length = utf8_sequence_length(text, i);
    if (length == 0) {
      result += REPLACEMENT_CHARACTER;
      ++i;
    } else {
      result.append(text, i, length);
      i += length;
    }
  }
  return result;
}

std::string preview(const ClipboardContent &content, size_t max_chars) {
  return std::visit(
      Overloaded{
          [](const ImageContent &image) {
            return "Image " + std::to_string(image.width) + "x" +
                   std::to_string(image.height);
          },
          [max_chars](const TextContent &content_text) {
            std::string text = sanitize_utf8(content_text.text);
            size_t cut = utf8_prefix_length(text, max_chars);
            if (cut >= text.size()) {
              return text;
            }
            return text.substr(0, cut) + "...";
          },
      },
      content);
}

} // namespace clipsync
