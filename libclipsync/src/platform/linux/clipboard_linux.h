/**
 * @file clipboard_linux.h
 * @brief Linux clipboard types and internal declarations
 *
 * Internal types for X11/Wayland clipboard access.
 */

#ifndef CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "clipsync/clipboard.h"
#include "clipsync/error.h"
#include <string>
#include <vector>

namespace clipsync {
namespace platform {

/**
 * @brief Clipboard backend type
 */
enum class ClipboardBackend {
  None,
  Wayland, // wl-paste / wl-copy
  Xclip,   // xclip
  Xsel     // xsel (text only)
};

/**
 * @brief Get human-readable name for clipboard backend
 */
const char *clipboard_backend_name(ClipboardBackend backend);

/**
 * @brief Pick a backend from the display server and installed tools
 */
ClipboardBackend detect_backend();

/**
 * @brief Classify a list of offered MIME types / X11 targets
 *
 * PNG wins over text when both are offered.
 */
ContentType classify_targets(const std::vector<std::string> &targets);

/**
 * @brief Clipboard driven through command-line tools
 */
class LinuxClipboard : public ClipboardAccess {
public:
  explicit LinuxClipboard(ClipboardBackend backend);

  Result<ContentType> content_type() override;
  Result<ClipboardContent> read() override;
  Result<ClipboardContent> read_as(ContentType type) override;
  Result<void> write(const ClipboardContent &content) override;

  ClipboardBackend backend() const { return backend_; }

private:
  Result<std::string> read_text();
  Result<Bytes> read_image();
  Result<void> write_text(const std::string &text);
  Result<void> write_image(const Bytes &png_data);

  ClipboardBackend backend_;
};

} // namespace platform
} // namespace clipsync

#endif // CLIPSYNC_PLATFORM_LINUX_CLIPBOARD_LINUX_H
