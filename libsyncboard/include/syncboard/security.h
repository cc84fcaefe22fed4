/**
 * @file security.h
 * @brief Randomness and hashing primitives for SyncBoard
 *
 * SyncBoard uses libsodium for:
 * - Unpredictable identifiers (file ids, generated client ids)
 * - BLAKE2b content digests (served as HTTP ETags)
 */

#ifndef SYNCBOARD_SECURITY_H
#define SYNCBOARD_SECURITY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <array>
#include <string>

namespace syncboard {

// ============================================================================
// Constants
// ============================================================================

/// Size of BLAKE2b hash (default)
constexpr size_t HASH_SIZE = 32;

/// Default number of random bytes behind a generated token (128 bits)
constexpr size_t TOKEN_SIZE = 16;

/// BLAKE2b hash
using Hash = std::array<Byte, HASH_SIZE>;

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize libsodium
 *
 * Safe to call more than once. Every function below initializes lazily,
 * but calling this early surfaces a broken crypto library at startup.
 */
SYNCBOARD_API Result<void> security_init();

/// Check whether security_init() has succeeded
SYNCBOARD_API bool is_security_initialized();

// ============================================================================
// Randomness
// ============================================================================

/**
 * @brief Fill a buffer with cryptographically secure random bytes
 */
SYNCBOARD_API Result<Bytes> random_bytes(size_t count);

/**
 * @brief Generate a random hex token
 * @param byte_count Entropy in bytes; the token has twice as many characters
 */
SYNCBOARD_API Result<std::string> generate_token(size_t byte_count = TOKEN_SIZE);

// ============================================================================
// Hashing
// ============================================================================

/**
 * @brief BLAKE2b-256 of a byte buffer
 */
SYNCBOARD_API Result<Hash> hash(const Bytes &data);

/**
 * @brief Hex-encoded BLAKE2b-256 of a byte buffer
 */
SYNCBOARD_API Result<std::string> digest_hex(const Bytes &data);

} // namespace syncboard

#endif // SYNCBOARD_SECURITY_H
