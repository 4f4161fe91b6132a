/**
 * @file clipboard.h
 * @brief Access to the local system clipboard
 *
 * The sync engine talks to the clipboard only through ClipboardAccess, so
 * the system clipboard can be swapped for an in-memory one in tests and
 * headless setups.
 */

#ifndef CLIPSYNC_CLIPBOARD_H
#define CLIPSYNC_CLIPBOARD_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace clipsync {

// ============================================================================
// Clipboard Access
// ============================================================================

/**
 * @brief Read/write capability over one clipboard
 *
 * Failures are reported as ClipboardAccessError (or NotSupported when no
 * backend exists). Implementations must be callable from any thread.
 */
class CLIPSYNC_API ClipboardAccess {
public:
  virtual ~ClipboardAccess() = default;

  /// What the clipboard currently holds
  virtual Result<ContentType> content_type() = 0;

  /// Current content; only meaningful when content_type() is not Empty
  virtual Result<ClipboardContent> read() = 0;

  /**
   * @brief Read content whose type the caller has just detected
   *
   * Lets a poller skip a second type detection. The default calls read().
   */
  virtual Result<ClipboardContent> read_as(ContentType type) {
    CLIPSYNC_UNUSED(type);
    return read();
  }

  /// Replace the clipboard content
  virtual Result<void> write(const ClipboardContent &content) = 0;
};

/**
 * @brief Create the desktop clipboard backend
 *
 * Uses wl-paste/wl-copy under Wayland and xclip or xsel under X11.
 * @return Backend, or NotSupported when no display server or tool is found
 */
CLIPSYNC_API Result<std::unique_ptr<ClipboardAccess>> create_system_clipboard();

// ============================================================================
// In-Memory Clipboard
// ============================================================================

/**
 * @brief Process-local clipboard
 *
 * Backs headless runs and tests. Writes can be made to fail on demand to
 * exercise error paths.
 */
class CLIPSYNC_API MemoryClipboard : public ClipboardAccess {
public:
  MemoryClipboard() = default;

  Result<ContentType> content_type() override;
  Result<ClipboardContent> read() override;
  Result<void> write(const ClipboardContent &content) override;

  /// Set content as if the local user had copied it
  void set(ClipboardContent content);

  /// Empty the clipboard
  void clear();

  /// Current content, if any
  std::optional<ClipboardContent> get() const;

  /// Make subsequent read()/write() calls fail with ClipboardAccessError
  void set_fail_reads(bool fail);
  void set_fail_writes(bool fail);

  /// Number of successful write() calls
  size_t write_count() const;

private:
  mutable std::mutex mutex_;
  std::optional<ClipboardContent> content_;
  bool fail_reads_ = false;
  bool fail_writes_ = false;
  size_t writes_ = 0;
};

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Read width and height from a PNG header
 * @return (width, height), or nullopt if @p png is not a PNG
 */
CLIPSYNC_API std::optional<std::pair<uint32_t, uint32_t>>
png_dimensions(const Bytes &png);

} // namespace clipsync

#endif // CLIPSYNC_CLIPBOARD_H
