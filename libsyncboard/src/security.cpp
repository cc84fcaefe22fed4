/**
 * @file security.cpp
 * @brief libsodium wrapper implementation for SyncBoard
 */

#include "syncboard/security.h"
#include <atomic>
#include <sodium.h>

namespace syncboard {

namespace {
std::atomic<bool> g_initialized{false};
}

// ============================================================================
// Initialization
// ============================================================================

Result<void> security_init() {
  if (g_initialized.load()) {
    return Result<void>::ok();
  }

  // sodium_init() is thread-safe and returns 1 when already initialized
  if (sodium_init() < 0) {
    return Error(ErrorCode::SecurityError, "Failed to initialize libsodium");
  }

  g_initialized.store(true);
  return Result<void>::ok();
}

bool is_security_initialized() { return g_initialized.load(); }

// Auto-initialize on first crypto operation
static inline Result<void> ensure_initialized() {
  if (!g_initialized.load()) {
    auto result = security_init();
    if (result.is_error()) {
      return result;
    }
  }
  return Result<void>::ok();
}

// ============================================================================
// Randomness
// ============================================================================

Result<Bytes> random_bytes(size_t count) {
  SYNCBOARD_TRY(ensure_initialized());

  Bytes out(count);
  if (count > 0) {
    randombytes_buf(out.data(), out.size());
  }
  return out;
}

Result<std::string> generate_token(size_t byte_count) {
  SYNCBOARD_REQUIRE(byte_count > 0, ErrorCode::InvalidArgument,
                    "Token size must be positive");

  auto bytes = random_bytes(byte_count);
  if (bytes.is_error()) {
    return bytes.error();
  }

  std::string hex(byte_count * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.size(), bytes.value().data(),
                 bytes.value().size());
  hex.resize(byte_count * 2);
  return hex;
}

// ============================================================================
// Hashing
// ============================================================================

Result<Hash> hash(const Bytes &data) {
  SYNCBOARD_TRY(ensure_initialized());

  Hash result;
  if (crypto_generichash(result.data(), HASH_SIZE, data.data(), data.size(),
                         nullptr, 0) != 0) {
    return Error(ErrorCode::SecurityError, "Hashing failed");
  }

  return result;
}

Result<std::string> digest_hex(const Bytes &data) {
  auto h = hash(data);
  if (h.is_error()) {
    return h.error();
  }
  return to_hex(h.value().data(), h.value().size());
}

} // namespace syncboard
