/**
 * @file clipboard_state.h
 * @brief Authoritative shared clipboard text
 *
 * The board holds exactly one text value. Writers use optimistic
 * concurrency: an update names the version it was based on and is applied
 * only if that is still the current version. The first update to arrive for
 * a given version wins; the others get StaleVersion together with the state
 * that beat them, re-read, and resubmit.
 */

#ifndef SYNCBOARD_CLIPBOARD_STATE_H
#define SYNCBOARD_CLIPBOARD_STATE_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstdint>
#include <mutex>
#include <string>

namespace syncboard {

// ============================================================================
// Clipboard Text
// ============================================================================

/**
 * @brief One immutable snapshot of the shared text
 */
struct ClipboardText {
  /// Text bytes (not necessarily valid UTF-8)
  std::string content;

  /// Incremented on every accepted write; 0 = never written
  uint64_t version = 0;

  /// When the accepted write happened
  WallTime updated_at;

  /// Client that made the write (empty for the initial value)
  ClientId updated_by;
};

// ============================================================================
// Clipboard State
// ============================================================================

/**
 * @brief Versioned compare-and-set register for the board text
 *
 * All methods are thread-safe. Critical sections only copy strings.
 */
class SYNCBOARD_API ClipboardState {
public:
  /**
   * @param max_size_bytes Largest accepted content
   */
  explicit ClipboardState(uint64_t max_size_bytes);

  // Non-copyable
  ClipboardState(const ClipboardState &) = delete;
  ClipboardState &operator=(const ClipboardState &) = delete;

  /**
   * @brief Latest accepted value (copy)
   */
  ClipboardText current() const;

  /**
   * @brief Current version number
   */
  uint64_t version() const;

  /**
   * @brief Replace the text if expected_version is still current
   * @param content New text
   * @param expected_version Version the writer based its edit on
   * @param author Writing client
   * @param current If non-null and the update is rejected as stale, receives
   *        the state that was current at the moment of rejection
   * @return The new state, or PayloadTooLarge / StaleVersion
   *
   * Size is checked before the version, so an oversized update reports
   * PayloadTooLarge even when it is also stale. A rejected update never
   * changes anything.
   */
  Result<ClipboardText> update(const std::string &content,
                               uint64_t expected_version, const ClientId &author,
                               ClipboardText *current = nullptr);

  /**
   * @brief Unconditionally reset the text to empty
   * @return The new state (version incremented)
   */
  ClipboardText clear(const ClientId &author);

  /// Configured size limit
  uint64_t max_size() const { return max_size_; }

private:
  mutable std::mutex mutex_;
  ClipboardText text_;
  const uint64_t max_size_;
};

} // namespace syncboard

#endif // SYNCBOARD_CLIPBOARD_STATE_H
