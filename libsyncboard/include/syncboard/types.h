/**
 * @file types.h
 * @brief Core type definitions for SyncBoard
 */

#ifndef SYNCBOARD_TYPES_H
#define SYNCBOARD_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace syncboard {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/// Immutable byte buffer shared between the store and in-flight readers
using SharedBytes = std::shared_ptr<const Bytes>;

// ============================================================================
// Identifiers
// ============================================================================

/// Opaque per-connection identifier, supplied by the transport
using ClientId = std::string;

/// File entry identifier (random token, hex encoded)
using FileId = std::string;

// ============================================================================
// Time
// ============================================================================

/// Wall-clock time, reported to clients
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

/// Monotonic time, used for expiry and liveness decisions
using MonoClock = std::chrono::steady_clock;
using MonoTime = MonoClock::time_point;

/// Milliseconds since the Unix epoch (wire format for timestamps)
SYNCBOARD_API int64_t to_unix_millis(WallTime time);

/// Inverse of to_unix_millis()
SYNCBOARD_API WallTime from_unix_millis(int64_t millis);

// ============================================================================
// Helpers
// ============================================================================

/// Lowercase hex encoding of a byte range
SYNCBOARD_API std::string to_hex(const Byte *data, size_t length);

/// Human-readable byte count ("1.5 MB")
SYNCBOARD_API std::string format_size(uint64_t bytes);

} // namespace syncboard

#endif // SYNCBOARD_TYPES_H
