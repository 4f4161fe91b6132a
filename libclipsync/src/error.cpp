/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "clipsync/error.h"
#include <sstream>

namespace clipsync {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::DiscoveryFailed:
    return "DiscoveryFailed";
  case ErrorCode::DiscoveryParseError:
    return "DiscoveryParseError";

  case ErrorCode::ConnectionFailed:
    return "ConnectionFailed";
  case ErrorCode::ConnectionLost:
    return "ConnectionLost";
  case ErrorCode::ConnectionRefused:
    return "ConnectionRefused";
  case ErrorCode::ConnectionTimeout:
    return "ConnectionTimeout";
  case ErrorCode::PeerNotFound:
    return "PeerNotFound";
  case ErrorCode::BindFailed:
    return "BindFailed";

  case ErrorCode::FrameError:
    return "FrameError";
  case ErrorCode::FrameTooLarge:
    return "FrameTooLarge";

  case ErrorCode::ClipboardAccessError:
    return "ClipboardAccessError";
  case ErrorCode::ClipboardEmpty:
    return "ClipboardEmpty";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::NotificationFailed:
    return "NotificationFailed";
  case ErrorCode::SecurityError:
    return "SecurityError";

  case ErrorCode::ConfigError:
    return "ConfigError";

  default:
    return "Unknown";
  }
}

// ============================================================================
// Error Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::DiscoveryFailed:
    return "Peer discovery could not be started";
  case ErrorCode::DiscoveryParseError:
    return "Malformed discovery datagram";

  case ErrorCode::ConnectionFailed:
    return "Failed to establish connection";
  case ErrorCode::ConnectionLost:
    return "Connection to peer was lost";
  case ErrorCode::ConnectionRefused:
    return "Connection was refused by peer";
  case ErrorCode::ConnectionTimeout:
    return "Connection attempt timed out";
  case ErrorCode::PeerNotFound:
    return "Peer device not found";
  case ErrorCode::BindFailed:
    return "No listening port could be bound";

  case ErrorCode::FrameError:
    return "Malformed message frame";
  case ErrorCode::FrameTooLarge:
    return "Message frame exceeds size limit";

  case ErrorCode::ClipboardAccessError:
    return "Clipboard could not be accessed";
  case ErrorCode::ClipboardEmpty:
    return "Clipboard is empty";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::NotificationFailed:
    return "Desktop notification could not be shown";
  case ErrorCode::SecurityError:
    return "Cryptographic library error";

  case ErrorCode::ConfigError:
    return "Invalid configuration";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::BindFailed:
  case ErrorCode::SecurityError:
  case ErrorCode::ConfigError:
    return false;

  // All others are potentially recoverable
  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace clipsync
