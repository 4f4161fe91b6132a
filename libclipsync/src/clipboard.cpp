/**
 * @file clipboard.cpp
 * @brief In-memory clipboard and shared clipboard helpers
 */

#include "clipsync/clipboard.h"

namespace clipsync {

// ============================================================================
// MemoryClipboard
// ============================================================================

Result<ContentType> MemoryClipboard::content_type() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_reads_) {
    return Error(ErrorCode::ClipboardAccessError, "Clipboard unavailable");
  }
  if (!content_ || is_empty(*content_)) {
    return ContentType::Empty;
  }
  return content_type_of(*content_);
}

Result<ClipboardContent> MemoryClipboard::read() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_reads_) {
    return Error(ErrorCode::ClipboardAccessError, "Clipboard unavailable");
  }
  if (!content_) {
    return Error(ErrorCode::ClipboardEmpty, "Clipboard is empty");
  }
  return *content_;
}

Result<void> MemoryClipboard::write(const ClipboardContent &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail_writes_) {
    return Error(ErrorCode::ClipboardAccessError, "Clipboard unavailable");
  }
  content_ = content;
  ++writes_;
  return Result<void>::ok();
}

void MemoryClipboard::set(ClipboardContent content) {
  std::lock_guard<std::mutex> lock(mutex_);
  content_ = std::move(content);
}

void MemoryClipboard::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  content_.reset();
}

std::optional<ClipboardContent> MemoryClipboard::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return content_;
}

void MemoryClipboard::set_fail_reads(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_reads_ = fail;
}

void MemoryClipboard::set_fail_writes(bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_writes_ = fail;
}

size_t MemoryClipboard::write_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writes_;
}

// ============================================================================
// PNG Header
// ============================================================================

std::optional<std::pair<uint32_t, uint32_t>> png_dimensions(const Bytes &png) {
  static const Byte SIGNATURE[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

  // Signature (8) + IHDR length (4) + "IHDR" (4) + width (4) + height (4)
  if (png.size() < 24) {
    return std::nullopt;
  }
  for (size_t i = 0; i < 8; ++i) {
    if (png[i] != SIGNATURE[i])
      return std::nullopt;
  }
  if (png[12] != 'I' || png[13] != 'H' || png[14] != 'D' || png[15] != 'R') {
    return std::nullopt;
  }

  auto be32 = [&png](size_t at) {
    return (static_cast<uint32_t>(png[at]) << 24) |
           (static_cast<uint32_t>(png[at + 1]) << 16) |
           (static_cast<uint32_t>(png[at + 2]) << 8) |
           static_cast<uint32_t>(png[at + 3]);
  };
  return std::make_pair(be32(16), be32(20));
}

} // namespace clipsync
