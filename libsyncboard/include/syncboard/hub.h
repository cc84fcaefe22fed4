/**
 * @file hub.h
 * @brief Mutation and fan-out gateway of the board
 *
 * The BroadcastHub is the only component that changes board state on behalf
 * of clients and the only one that talks to the Transport. A mutation and
 * the fan-out of its event happen under one lock, so every client sees
 * events in the order the hub emitted them and never observes one mutation
 * interleaved with another's broadcast.
 *
 * Sends are non-blocking. A client whose send fails is closed and
 * unregistered after the fan-out completes; the other clients are not
 * affected.
 */

#ifndef SYNCBOARD_HUB_H
#define SYNCBOARD_HUB_H

#include "board.h"
#include "error.h"
#include "platform.h"
#include "protocol.h"
#include "transport.h"
#include "types.h"
#include <memory>
#include <string>
#include <vector>

namespace syncboard {

/**
 * @brief Accepts client intents, mutates the board, fans out events
 *
 * Example:
 * @code
 *   Board board(config.board_config());
 *   WsServer server;
 *   BroadcastHub hub(board, server);
 *   server.start(config, hub);
 * @endcode
 */
class SYNCBOARD_API BroadcastHub {
public:
  BroadcastHub(Board &board, Transport &transport);
  ~BroadcastHub();

  // Non-copyable
  BroadcastHub(const BroadcastHub &) = delete;
  BroadcastHub &operator=(const BroadcastHub &) = delete;

  // ========================================================================
  // Connection Lifecycle
  // ========================================================================

  /**
   * @brief Register a new connection and bring it up to date
   *
   * Sends the client (only) a welcome, the current text and the file list,
   * then tells everyone the new client count.
   *
   * @return DuplicateClient if the id is already registered
   */
  Result<void> on_client_connected(const ClientId &id,
                                   const std::string &remote_address = {});

  /**
   * @brief Unregister a connection and broadcast the new client count
   *
   * No-op for ids that are not registered.
   */
  void on_client_disconnected(const ClientId &id);

  /**
   * @brief Record transport-level liveness (a WebSocket ping or pong)
   *
   * Keeps a connected client that never sends application frames from
   * being reaped. Ignored for ids that are not registered.
   */
  void on_client_heartbeat(const ClientId &id);
  void on_client_heartbeat(const ClientId &id, MonoTime now);

  /**
   * @brief Decode and dispatch one frame from a client
   *
   * Counts as a heartbeat. Malformed frames are answered with an error
   * event to the sender only.
   */
  void on_message(const ClientId &id, const std::string &frame);

  // ========================================================================
  // Intents
  // ========================================================================

  /**
   * @brief Compare-and-set the clipboard text
   *
   * On success everyone, the sender included, receives text_update. On
   * StaleVersion only the sender receives text_rejected with the current
   * state; on PayloadTooLarge only the sender receives an error.
   */
  Result<ClipboardText> on_text_submit(const ClientId &id,
                                       const std::string &content,
                                       uint64_t expected_version);

  /**
   * @brief Store an uploaded file and broadcast file_added
   *
   * When storage is full, expired entries are swept (and their removal
   * broadcast) before one retry. Failures are reported to the uploader only,
   * and only if it is a registered connection.
   */
  Result<FileMeta> on_file_upload(const ClientId &id,
                                  const std::string &filename,
                                  const std::string &mime_type, Bytes data);

  /**
   * @brief Read a file for download (no broadcast)
   */
  Result<FileEntry> on_file_download_request(const FileId &file_id) const;

  /**
   * @brief Delete a file and broadcast file_removed
   * @return NotFound if there was nothing to delete
   */
  Result<void> on_file_delete(const ClientId &id, const FileId &file_id);

  /**
   * @brief Send the file list to one client
   */
  void on_file_list_request(const ClientId &id);

  /**
   * @brief Empty the text and remove every file, broadcasting each change
   */
  void on_clear(const ClientId &id);

  // ========================================================================
  // Periodic Work
  // ========================================================================

  /**
   * @brief Evict expired files and broadcast file_removed for each
   * @return Ids removed
   */
  std::vector<FileId> periodic_sweep();
  std::vector<FileId> periodic_sweep(MonoTime now);

  /**
   * @brief Close and unregister clients that stopped sending heartbeats
   * @return Ids reaped
   */
  std::vector<ClientId> reap_idle_clients();
  std::vector<ClientId> reap_idle_clients(MonoTime now);

  // ========================================================================
  // Access
  // ========================================================================

  Board &board();
  const Board &board() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_HUB_H
