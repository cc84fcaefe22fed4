/**
 * @file error.h
 * @brief Error codes and result types for SyncBoard
 *
 * SyncBoard reports failures as values. Every fallible core operation returns
 * a Result<T>; third-party exceptions are caught at the boundary where they
 * arise and converted into an Error.
 */

#ifndef SYNCBOARD_ERROR_H
#define SYNCBOARD_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace syncboard {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  NotInitialized = 4,
  AlreadyInitialized = 5,
  Timeout = 6,
  Cancelled = 7,

  // Connection errors (100-199)
  DuplicateClient = 100,
  ClientNotFound = 101,
  TransportFailure = 102,

  // Clipboard errors (200-299)
  StaleVersion = 200,
  PayloadTooLarge = 201,

  // File store errors (300-399)
  NotFound = 300,
  Expired = 301,
  StorageFull = 302,

  // Protocol errors (400-499)
  MalformedMessage = 400,
  UnknownMessageType = 401,

  // Configuration errors (500-599)
  ConfigError = 500,
  ConfigFileNotFound = 501,

  // Security errors (600-699)
  SecurityError = 600,

  // Platform errors (700-799)
  PlatformError = 700,
  AddressInUse = 701
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details; // Additional context

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<FileMeta> result = store.put(name, mime, data);
 *   if (result) {
 *       broadcast(result.value());
 *   } else {
 *       reply(result.error());
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }
  explicit operator bool() const { return is_ok(); }

  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define SYNCBOARD_TRY(result)                                                  \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define SYNCBOARD_REQUIRE(condition, error_code, message)                      \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::syncboard::Error(error_code, message);                          \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
SYNCBOARD_API const char *error_code_name(ErrorCode code);

/// Get description for error code
SYNCBOARD_API const char *error_code_description(ErrorCode code);

/// Check if error code is an expected outcome of concurrent use
SYNCBOARD_API bool is_recoverable(ErrorCode code);

} // namespace syncboard

#endif // SYNCBOARD_ERROR_H
