/**
 * @file server.h
 * @brief WebSocket front end of the board
 *
 * WebSocket upgrades on /ws carry JSON intents and events. File transfer
 * runs on a separate port through HttpServer.
 *
 * Connections are assigned random client ids on open. Every inbound
 * callback is forwarded to the BroadcastHub; the hub calls back through the
 * Transport interface to send events. Each open connection is pinged on an
 * interval and every ping or pong counts as a heartbeat, so clients that
 * only listen are not reaped as idle.
 */

#ifndef SYNCBOARD_SERVER_H
#define SYNCBOARD_SERVER_H

#include "config.h"
#include "error.h"
#include "hub.h"
#include "platform.h"
#include "transport.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace syncboard {

/// Path WebSocket clients connect to
constexpr const char *WEBSOCKET_PATH = "/ws";

/**
 * @brief websocketpp server implementing the Transport
 *
 * Example:
 * @code
 *   WsServer server;
 *   BroadcastHub hub(board, server);
 *   auto started = server.start(config, hub);
 *   if (!started) {
 *       spdlog::error("{}", started.error().to_string());
 *   }
 * @endcode
 */
class SYNCBOARD_API WsServer : public Transport {
public:
  WsServer();
  ~WsServer() override;

  // Non-copyable
  WsServer(const WsServer &) = delete;
  WsServer &operator=(const WsServer &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Bind, listen and start the event-loop threads
   * @param config Network settings (bind address, ws_port, threads, limits)
   * @param hub Receives every connection callback; must outlive the server
   * @return AddressInUse if the port is taken, ConfigError for a bad bind
   *         address, AlreadyInitialized if running, PlatformError otherwise
   */
  Result<void> start(const SyncBoardConfig &config, BroadcastHub &hub);

  /**
   * @brief Stop accepting, close every connection and join the threads
   */
  void stop();

  bool is_running() const;

  /// Port actually bound (differs from the configured one when that was 0)
  uint16_t port() const;

  /// Number of open WebSocket connections
  size_t connection_count() const;

  // ========================================================================
  // Transport
  // ========================================================================

  Result<void> send_to(const ClientId &id, const Event &event) override;
  void close(const ClientId &id, const std::string &reason) override;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Interval between server pings on each WebSocket connection
 *
 * A quarter of the client timeout, never below 250 ms. With reaping
 * disabled (timeout 0) connections are still pinged every 30 seconds.
 */
SYNCBOARD_API std::chrono::milliseconds
ping_interval_for(const SyncBoardConfig &config);

/**
 * @brief Check that a TCP port can be bound before handing it to a server
 * @return ConfigError for an unparsable address, AddressInUse if taken.
 *         Port 0 always succeeds.
 */
SYNCBOARD_API Result<void> check_port_free(const std::string &bind_address,
                                           uint16_t port);

/**
 * @brief Address other LAN devices can reach this host on
 *
 * Picks the interface a route to the outside would use. Falls back to
 * "127.0.0.1" when there is no route.
 */
SYNCBOARD_API std::string get_local_address();

} // namespace syncboard

#endif // SYNCBOARD_SERVER_H
