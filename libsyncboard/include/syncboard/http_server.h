/**
 * @file http_server.h
 * @brief HTTP endpoints for uploading, downloading and listing files
 *
 * Routes:
 * - POST   /upload       raw body or multipart/form-data
 * - GET    /files        JSON list of live files
 * - GET    /files/<id>   file bytes
 * - DELETE /files/<id>   explicit delete
 * - GET    /health       liveness and counts
 *
 * Every request is forwarded to the BroadcastHub, so HTTP uploads and
 * deletes reach WebSocket clients like any other change.
 */

#ifndef SYNCBOARD_HTTP_SERVER_H
#define SYNCBOARD_HTTP_SERVER_H

#include "config.h"
#include "error.h"
#include "hub.h"
#include "platform.h"
#include <cstdint>
#include <memory>

namespace syncboard {

/// Extra request body allowance for multipart framing around an upload
constexpr uint64_t MULTIPART_OVERHEAD = 64 * 1024;

/**
 * @brief cpp-httplib server for the file endpoints
 */
class SYNCBOARD_API HttpServer {
public:
  HttpServer();
  ~HttpServer();

  // Non-copyable
  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Bind `config.port` and serve on a background thread
   * @param hub Handles every request; must outlive the server
   * @return AddressInUse if the port is taken, ConfigError for a bad bind
   *         address, AlreadyInitialized if running, PlatformError otherwise
   */
  Result<void> start(const SyncBoardConfig &config, BroadcastHub &hub);

  /// Stop serving and join the listener thread
  void stop();

  bool is_running() const;

  /// Port actually bound (differs from the configured one when that was 0)
  uint16_t port() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_HTTP_SERVER_H
