/**
 * @file clipboard_linux.cpp
 * @brief Linux clipboard implementation
 *
 * Implements clipboard access using command-line tools (wl-clipboard, xclip,
 * xsel) for maximum compatibility across different Linux environments.
 */

#include "clipboard_linux.h"
#include "clipsync/log.h"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <pthread.h>
#include <sstream>
#include <sys/wait.h>

namespace clipsync {
namespace platform {

namespace {

constexpr const char *TAG = "clipboard";

/**
 * @brief Run a command and capture its raw output
 *
 * Output is read with fread so binary data (PNG) survives intact. A non-zero
 * exit status is an error; the wl-paste and xclip tools use it for "nothing
 * of that type on the clipboard".
 */
Result<std::string> execute_command(const std::string &cmd) {
  FILE *pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Failed to execute command: " + cmd);
  }

  std::string result;
  std::array<char, 4096> buffer;
  size_t n;
  while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
    result.append(buffer.data(), n);
  }

  int status = pclose(pipe);
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return Error(ErrorCode::ClipboardAccessError, "Command failed: " + cmd);
  }

  return result;
}

/**
 * @brief Blocks SIGPIPE on the calling thread for its lifetime
 *
 * A write to a pipe whose reader has exited then fails with EPIPE instead
 * of killing the process. A SIGPIPE raised meanwhile is consumed before
 * the old mask is restored, unless one was already pending.
 */
class SigpipeBlock {
public:
  SigpipeBlock() {
    sigemptyset(&pipe_set_);
    sigaddset(&pipe_set_, SIGPIPE);

    sigset_t pending;
    sigemptyset(&pending);
    if (sigpending(&pending) == 0) {
      was_pending_ = sigismember(&pending, SIGPIPE) == 1;
    }
    blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
  }

  ~SigpipeBlock() {
    if (!blocked_) {
      return;
    }
    if (!was_pending_) {
      struct timespec zero = {0, 0};
      while (sigtimedwait(&pipe_set_, nullptr, &zero) == SIGPIPE) {
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
  }

  SigpipeBlock(const SigpipeBlock &) = delete;
  SigpipeBlock &operator=(const SigpipeBlock &) = delete;

private:
  sigset_t pipe_set_;
  sigset_t old_mask_;
  bool was_pending_ = false;
  bool blocked_ = false;
};

/**
 * @brief Run a command feeding it input data
 *
 * A tool that exits before reading all of its input makes the write fail
 * with EPIPE; that is reported as ClipboardAccessError.
 */
Result<void> execute_command_with_input(const std::string &cmd,
                                        const std::string &input) {
  SigpipeBlock no_sigpipe;

  FILE *pipe = popen(cmd.c_str(), "w");
  if (!pipe) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Failed to execute command: " + cmd);
  }

  bool written = fwrite(input.data(), 1, input.size(), pipe) == input.size() &&
                 fflush(pipe) == 0;
  int write_errno = errno;
  int status = pclose(pipe);

  if (!written) {
    return Error(ErrorCode::ClipboardAccessError,
                 "Failed to write to " + cmd,
                 write_errno == EPIPE ? "Tool exited before reading input"
                                      : "");
  }
  if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    return Error(ErrorCode::ClipboardAccessError, "Command failed: " + cmd);
  }

  return Result<void>::ok();
}

/**
 * @brief Check if a command exists
 */
bool command_exists(const char *cmd) {
  std::string check = "command -v ";
  check += cmd;
  check += " >/dev/null 2>&1";
  return system(check.c_str()) == 0;
}

bool env_set(const char *name) {
  const char *value = std::getenv(name);
  return value && value[0] != '\0';
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(line);
    }
  }
  return lines;
}

} // namespace

// ============================================================================
// Backend Detection
// ============================================================================

const char *clipboard_backend_name(ClipboardBackend backend) {
  switch (backend) {
  case ClipboardBackend::None:
    return "None";
  case ClipboardBackend::Wayland:
    return "wl-clipboard";
  case ClipboardBackend::Xclip:
    return "xclip";
  case ClipboardBackend::Xsel:
    return "xsel";
  default:
    return "Unknown";
  }
}

ClipboardBackend detect_backend() {
  if (env_set("WAYLAND_DISPLAY") && command_exists("wl-paste") &&
      command_exists("wl-copy")) {
    return ClipboardBackend::Wayland;
  }

  if (env_set("DISPLAY")) {
    if (command_exists("xclip")) {
      return ClipboardBackend::Xclip;
    }
    if (command_exists("xsel")) {
      return ClipboardBackend::Xsel;
    }
  }

  return ClipboardBackend::None;
}

ContentType classify_targets(const std::vector<std::string> &targets) {
  bool has_text = false;
  for (const auto &target : targets) {
    if (target == "image/png") {
      return ContentType::Image;
    }
    if (target == "UTF8_STRING" || target == "STRING" || target == "TEXT" ||
        target.rfind("text/plain", 0) == 0) {
      has_text = true;
    }
  }
  return has_text ? ContentType::Text : ContentType::Empty;
}

// ============================================================================
// LinuxClipboard
// ============================================================================

LinuxClipboard::LinuxClipboard(ClipboardBackend backend) : backend_(backend) {}

Result<ContentType> LinuxClipboard::content_type() {
  switch (backend_) {
  case ClipboardBackend::Wayland: {
    // wl-paste exits non-zero when the clipboard is empty
    auto types = execute_command("wl-paste --list-types 2>/dev/null");
    if (types.is_error()) {
      return ContentType::Empty;
    }
    return classify_targets(split_lines(types.value()));
  }
  case ClipboardBackend::Xclip: {
    auto targets =
        execute_command("xclip -selection clipboard -t TARGETS -o 2>/dev/null");
    if (targets.is_error()) {
      return ContentType::Empty;
    }
    return classify_targets(split_lines(targets.value()));
  }
  case ClipboardBackend::Xsel: {
    auto text = read_text();
    if (text.is_error()) {
      return text.error();
    }
    return text.value().empty() ? ContentType::Empty : ContentType::Text;
  }
  default:
    return Error(ErrorCode::NotSupported, "No clipboard backend available");
  }
}

Result<ClipboardContent> LinuxClipboard::read() {
  auto type = content_type();
  if (type.is_error()) {
    return type.error();
  }
  return read_as(type.value());
}

Result<ClipboardContent> LinuxClipboard::read_as(ContentType type) {
  switch (type) {
  case ContentType::Image: {
    auto png = read_image();
    if (png.is_error()) {
      return png.error();
    }
    ImageContent image;
    if (auto dims = png_dimensions(png.value())) {
      image.width = dims->first;
      image.height = dims->second;
    }
    image.bytes = std::move(png).value();
    return ClipboardContent(std::move(image));
  }
  case ContentType::Text: {
    auto text = read_text();
    if (text.is_error()) {
      return text.error();
    }
    return ClipboardContent(TextContent{std::move(text).value()});
  }
  default:
    return Error(ErrorCode::ClipboardEmpty, "Clipboard is empty");
  }
}

Result<void> LinuxClipboard::write(const ClipboardContent &content) {
  return std::visit(
      Overloaded{
          [this](const TextContent &text) { return write_text(text.text); },
          [this](const ImageContent &image) {
            return write_image(image.bytes);
          },
      },
      content);
}

// ============================================================================
// Clipboard Operations
// ============================================================================

Result<std::string> LinuxClipboard::read_text() {
  switch (backend_) {
  case ClipboardBackend::Wayland:
    return execute_command("wl-paste --no-newline --type text 2>/dev/null");
  case ClipboardBackend::Xclip:
    return execute_command("xclip -selection clipboard -o 2>/dev/null");
  case ClipboardBackend::Xsel:
    return execute_command("xsel --clipboard --output 2>/dev/null");
  default:
    return Error(ErrorCode::NotSupported, "No clipboard backend available");
  }
}

Result<Bytes> LinuxClipboard::read_image() {
  Result<std::string> result = std::string();

  switch (backend_) {
  case ClipboardBackend::Wayland:
    result = execute_command("wl-paste --type image/png 2>/dev/null");
    break;
  case ClipboardBackend::Xclip:
    result =
        execute_command("xclip -selection clipboard -t image/png -o 2>/dev/null");
    break;
  default:
    return Error(ErrorCode::NotSupported,
                 std::string("Images not supported by ") +
                     clipboard_backend_name(backend_));
  }

  if (result.is_error()) {
    return result.error();
  }

  const auto &str = result.value();
  return Bytes(str.begin(), str.end());
}

Result<void> LinuxClipboard::write_text(const std::string &text) {
  switch (backend_) {
  case ClipboardBackend::Wayland:
    return execute_command_with_input("wl-copy 2>/dev/null", text);
  case ClipboardBackend::Xclip:
    return execute_command_with_input("xclip -selection clipboard 2>/dev/null",
                                      text);
  case ClipboardBackend::Xsel:
    return execute_command_with_input("xsel --clipboard --input 2>/dev/null",
                                      text);
  default:
    return Error(ErrorCode::NotSupported, "No clipboard backend available");
  }
}

Result<void> LinuxClipboard::write_image(const Bytes &png_data) {
  std::string data(png_data.begin(), png_data.end());

  switch (backend_) {
  case ClipboardBackend::Wayland:
    return execute_command_with_input("wl-copy --type image/png 2>/dev/null",
                                      data);
  case ClipboardBackend::Xclip:
    return execute_command_with_input(
        "xclip -selection clipboard -t image/png 2>/dev/null", data);
  default:
    return Error(ErrorCode::NotSupported,
                 std::string("Images not supported by ") +
                     clipboard_backend_name(backend_));
  }
}

} // namespace platform

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<ClipboardAccess>> create_system_clipboard() {
  auto backend = platform::detect_backend();
  if (backend == platform::ClipboardBackend::None) {
    return Error(ErrorCode::NotSupported,
                 "No clipboard tool found",
                 "Install wl-clipboard (Wayland) or xclip/xsel (X11)");
  }

  CLIPSYNC_LOG_INFO(platform::TAG,
                    std::string("Using clipboard backend ") +
                        platform::clipboard_backend_name(backend));
  return Result<std::unique_ptr<ClipboardAccess>>(
      std::make_unique<platform::LinuxClipboard>(backend));
}

} // namespace clipsync
