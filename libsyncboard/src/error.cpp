/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "syncboard/error.h"
#include <sstream>

namespace syncboard {

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
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::DuplicateClient:
    return "DuplicateClient";
  case ErrorCode::ClientNotFound:
    return "ClientNotFound";
  case ErrorCode::TransportFailure:
    return "TransportFailure";

  case ErrorCode::StaleVersion:
    return "StaleVersion";
  case ErrorCode::PayloadTooLarge:
    return "PayloadTooLarge";

  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Expired:
    return "Expired";
  case ErrorCode::StorageFull:
    return "StorageFull";

  case ErrorCode::MalformedMessage:
    return "MalformedMessage";
  case ErrorCode::UnknownMessageType:
    return "UnknownMessageType";

  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::ConfigFileNotFound:
    return "ConfigFileNotFound";

  case ErrorCode::SecurityError:
    return "SecurityError";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::AddressInUse:
    return "AddressInUse";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
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
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::DuplicateClient:
    return "A client with this id is already connected";
  case ErrorCode::ClientNotFound:
    return "No connected client with this id";
  case ErrorCode::TransportFailure:
    return "Sending to or receiving from a connection failed";

  case ErrorCode::StaleVersion:
    return "Update targeted an outdated clipboard version";
  case ErrorCode::PayloadTooLarge:
    return "Payload exceeds the configured size limit";

  case ErrorCode::NotFound:
    return "File not found";
  case ErrorCode::Expired:
    return "File has expired";
  case ErrorCode::StorageFull:
    return "In-memory file storage is full";

  case ErrorCode::MalformedMessage:
    return "Message could not be parsed";
  case ErrorCode::UnknownMessageType:
    return "Message type is not recognized";

  case ErrorCode::ConfigError:
    return "Invalid configuration";
  case ErrorCode::ConfigFileNotFound:
    return "Configuration file not found";

  case ErrorCode::SecurityError:
    return "Security error occurred";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::AddressInUse:
    return "Listen address is already in use";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Expected outcomes of concurrent use; reported to the originator only
  case ErrorCode::StaleVersion:
  case ErrorCode::PayloadTooLarge:
  case ErrorCode::StorageFull:
  case ErrorCode::NotFound:
  case ErrorCode::Expired:
  case ErrorCode::DuplicateClient:
  case ErrorCode::ClientNotFound:
  case ErrorCode::TransportFailure:
  case ErrorCode::MalformedMessage:
  case ErrorCode::UnknownMessageType:
  case ErrorCode::InvalidArgument:
  case ErrorCode::Timeout:
  case ErrorCode::Cancelled:
    return true;

  default:
    return false;
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

  return oss.str();
}

} // namespace syncboard
