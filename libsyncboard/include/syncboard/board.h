/**
 * @file board.h
 * @brief The shared board: clipboard text, stored files and clients
 */

#ifndef SYNCBOARD_BOARD_H
#define SYNCBOARD_BOARD_H

#include "clipboard_state.h"
#include "connection_registry.h"
#include "file_store.h"
#include "platform.h"
#include <chrono>

namespace syncboard {

/**
 * @brief Settings a Board is constructed from
 */
struct BoardConfig {
  FileStoreConfig files;

  /// Largest accepted clipboard text
  uint64_t max_text_size_bytes = 4ull * 1024 * 1024;

  /// Reap clients silent for this long (zero disables reaping)
  std::chrono::seconds client_timeout{120};
};

/**
 * @brief One shared clipboard session
 *
 * Owns the three pieces of board state. There is no global instance; the
 * server constructs one Board and hands it to a BroadcastHub.
 */
class SYNCBOARD_API Board {
public:
  explicit Board(const BoardConfig &config);
  ~Board();

  // Non-copyable
  Board(const Board &) = delete;
  Board &operator=(const Board &) = delete;

  ClipboardState &clipboard() { return clipboard_; }
  const ClipboardState &clipboard() const { return clipboard_; }

  FileStore &files() { return files_; }
  const FileStore &files() const { return files_; }

  ConnectionRegistry &clients() { return clients_; }
  const ConnectionRegistry &clients() const { return clients_; }

  const BoardConfig &config() const { return config_; }

  /**
   * @brief Drop every client and every file
   *
   * Called on server shutdown, after the transport has stopped.
   */
  void shutdown();

private:
  BoardConfig config_;
  ClipboardState clipboard_;
  FileStore files_;
  ConnectionRegistry clients_;
};

} // namespace syncboard

#endif // SYNCBOARD_BOARD_H
