/**
 * @file clipboard_state.cpp
 * @brief Versioned clipboard text implementation
 */

#include "syncboard/clipboard_state.h"

namespace syncboard {

ClipboardState::ClipboardState(uint64_t max_size_bytes)
    : max_size_(max_size_bytes) {
  text_.updated_at = WallClock::now();
}

ClipboardText ClipboardState::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_;
}

uint64_t ClipboardState::version() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return text_.version;
}

Result<ClipboardText> ClipboardState::update(const std::string &content,
                                             uint64_t expected_version,
                                             const ClientId &author,
                                             ClipboardText *current) {
  if (content.size() > max_size_) {
    return Error(ErrorCode::PayloadTooLarge, "Clipboard text too large",
                 std::to_string(content.size()) + " > " +
                     std::to_string(max_size_) + " bytes");
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (expected_version != text_.version) {
    if (current) {
      *current = text_;
    }
    return Error(ErrorCode::StaleVersion, "Clipboard changed since version " +
                                              std::to_string(expected_version),
                 "current version " + std::to_string(text_.version));
  }

  text_.content = content;
  text_.version += 1;
  text_.updated_at = WallClock::now();
  text_.updated_by = author;
  return text_;
}

ClipboardText ClipboardState::clear(const ClientId &author) {
  std::lock_guard<std::mutex> lock(mutex_);
  text_.content.clear();
  text_.version += 1;
  text_.updated_at = WallClock::now();
  text_.updated_by = author;
  return text_;
}

} // namespace syncboard
