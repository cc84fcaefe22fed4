/**
 * @file main.cpp
 * @brief SyncBoard server entry point
 */

#include <syncboard/syncboard.h>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <iostream>

using namespace syncboard;

namespace {

void print_banner(const SyncBoardConfig &config, uint16_t http_port,
                  uint16_t ws_port) {
  std::string host = config.bind_address;
  if (host == "0.0.0.0" || host == "::") {
    host = get_local_address();
  }
  std::cout << "\n"
            << "  SyncBoard " << VERSION_STRING << "\n"
            << "  Local:     http://127.0.0.1:" << http_port << "\n"
            << "  Network:   http://" << host << ":" << http_port << "\n"
            << "  WebSocket: ws://" << host << ":" << ws_port << WEBSOCKET_PATH
            << "\n"
            << "  Files expire after " << config.file_ttl_seconds
            << "s, uploads up to " << format_size(config.max_file_size_bytes)
            << "\n\n"
            << std::flush;
}

} // namespace

int main(int argc, char *argv[]) {
  ConfigManager manager;
  auto command = manager.parse_command_line(argc, argv);
  if (command.is_error()) {
    std::cerr << command.error().to_string() << "\n\n"
              << command_line_usage(argv[0]);
    return 2;
  }
  if (command.value().show_help) {
    std::cout << command_line_usage(argv[0]);
    return 0;
  }
  if (command.value().show_version) {
    std::cout << "syncboard-server " << get_version().version_string << "\n";
    return 0;
  }

  const SyncBoardConfig &config = manager.get();

  auto logging = init_logging(config.log_level);
  if (logging.is_error()) {
    std::cerr << logging.error().to_string() << "\n";
    return 1;
  }
  if (!config.config_file_path.empty()) {
    spdlog::info("Loaded configuration from {}",
                 config.config_file_path.string());
  }

  auto security = security_init();
  if (security.is_error()) {
    spdlog::error("{}", security.error().to_string());
    return 1;
  }

  // ========================================================================
  // Board, transport and hub
  // ========================================================================

  Board board(config.board_config());
  WsServer server;
  BroadcastHub hub(board, server);

  auto started = server.start(config, hub);
  if (started.is_error()) {
    spdlog::error("Cannot start WebSocket server: {}",
                  started.error().to_string());
    return 1;
  }

  HttpServer http;
  auto serving = http.start(config, hub);
  if (serving.is_error()) {
    spdlog::error("Cannot start HTTP server: {}", serving.error().to_string());
    server.stop();
    return 1;
  }

  // ========================================================================
  // Background work
  // ========================================================================

  Sweeper expiry("expiry sweeper");
  auto sweeping = expiry.start(
      std::chrono::seconds(config.sweep_interval_seconds),
      [&hub]() { hub.periodic_sweep(); });
  if (sweeping.is_error()) {
    spdlog::error("{}", sweeping.error().to_string());
    http.stop();
    server.stop();
    return 1;
  }

  Sweeper reaper("idle reaper");
  if (config.client_timeout_seconds > 0) {
    auto interval = std::max<std::chrono::milliseconds>(
        std::chrono::seconds(config.client_timeout_seconds) / 2,
        std::chrono::seconds(1));
    auto reaping = reaper.start(interval, [&hub]() { hub.reap_idle_clients(); });
    if (reaping.is_error()) {
      spdlog::error("{}", reaping.error().to_string());
      expiry.stop();
      http.stop();
      server.stop();
      return 1;
    }
  }

  print_banner(config, http.port(), server.port());

  // ========================================================================
  // Wait for SIGINT / SIGTERM
  // ========================================================================

  boost::asio::io_context signals_context;
  boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code &ec, int signal) {
    if (!ec) {
      spdlog::info("Received signal {}, shutting down", signal);
    }
  });
  signals_context.run();

  reaper.stop();
  expiry.stop();
  http.stop();
  server.stop();
  board.shutdown();

  spdlog::info("Goodbye");
  return 0;
}
