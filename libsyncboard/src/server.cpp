/**
 * @file server.cpp
 * @brief websocketpp implementation of the board's WebSocket front end
 */

#include "syncboard/server.h"
#include "syncboard/security.h"
#include "syncboard/syncboard.h"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace syncboard {

namespace {

using Server = websocketpp::server<websocketpp::config::asio>;
using ConnectionHdl = websocketpp::connection_hdl;

/// How long stop() waits for close handshakes before stopping the loop
constexpr std::chrono::milliseconds SHUTDOWN_GRACE{1000};

/// Ping interval when idle reaping is disabled
constexpr std::chrono::milliseconds UNREAPED_PING_INTERVAL{30000};

/// Lower bound on the ping interval for very short client timeouts
constexpr std::chrono::milliseconds MIN_PING_INTERVAL{250};

} // namespace

// ============================================================================
// WsServer Implementation
// ============================================================================

class WsServer::Impl {
public:
  Server server;
  BroadcastHub *hub = nullptr;
  bool asio_initialized = false;
  uint64_t max_outbound_buffer_bytes = DEFAULT_MAX_OUTBOUND_BUFFER;
  std::chrono::milliseconds ping_interval = UNREAPED_PING_INTERVAL;

  std::vector<std::thread> threads;
  std::atomic<bool> running{false};

  // Guards the two connection maps and the ping timer. Never held while
  // calling the hub.
  mutable std::mutex mutex;
  std::map<ClientId, ConnectionHdl> connections;
  std::map<ConnectionHdl, ClientId, std::owner_less<ConnectionHdl>> client_ids;
  Server::timer_ptr ping_timer;

  Impl() {
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.set_reuse_addr(true);
    server.set_max_message_size(MAX_FRAME_SIZE);
    server.set_user_agent(std::string("SyncBoard/") + VERSION_STRING);

    server.set_validate_handler(
        [this](ConnectionHdl hdl) { return on_validate(hdl); });
    server.set_open_handler([this](ConnectionHdl hdl) { on_open(hdl); });
    server.set_close_handler([this](ConnectionHdl hdl) { on_close(hdl); });
    server.set_fail_handler([this](ConnectionHdl hdl) { on_fail(hdl); });
    server.set_message_handler(
        [this](ConnectionHdl hdl, Server::message_ptr msg) {
          on_frame(hdl, msg);
        });
    server.set_ping_handler([this](ConnectionHdl hdl, std::string) {
      heartbeat(hdl);
      return true;
    });
    server.set_pong_handler(
        [this](ConnectionHdl hdl, std::string) { heartbeat(hdl); });
  }

  // ========================================================================
  // Connection Map
  // ========================================================================

  bool lookup_handle(const ClientId &id, ConnectionHdl &hdl) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = connections.find(id);
    if (it == connections.end()) {
      return false;
    }
    hdl = it->second;
    return true;
  }

  bool lookup_id(ConnectionHdl hdl, ClientId &id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = client_ids.find(hdl);
    if (it == client_ids.end()) {
      return false;
    }
    id = it->second;
    return true;
  }

  bool forget(ConnectionHdl hdl, ClientId &id) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = client_ids.find(hdl);
    if (it == client_ids.end()) {
      return false;
    }
    id = it->second;
    connections.erase(id);
    client_ids.erase(it);
    return true;
  }

  // ========================================================================
  // WebSocket Handlers
  // ========================================================================

  bool on_validate(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server.get_con_from_hdl(hdl, ec);
    if (ec) {
      return false;
    }
    const std::string &resource = con->get_resource();
    if (resource.substr(0, resource.find('?')) != WEBSOCKET_PATH) {
      spdlog::debug("Refused WebSocket upgrade on {}", con->get_resource());
      con->set_status(websocketpp::http::status_code::not_found);
      return false;
    }
    return true;
  }

  void on_open(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server.get_con_from_hdl(hdl, ec);
    if (ec) {
      return;
    }

    auto token = generate_token();
    if (token.is_error()) {
      spdlog::error("Cannot assign client id: {}", token.error().to_string());
      server.close(hdl, websocketpp::close::status::internal_endpoint_error,
                   "no client id", ec);
      return;
    }
    const ClientId id = token.value();

    {
      std::lock_guard<std::mutex> lock(mutex);
      connections[id] = hdl;
      client_ids[hdl] = id;
    }

    auto registered = hub->on_client_connected(id, con->get_remote_endpoint());
    if (registered.is_error()) {
      ClientId forgotten;
      forget(hdl, forgotten);
      server.close(hdl, websocketpp::close::status::try_again_later,
                   registered.error().message, ec);
    }
  }

  void on_close(ConnectionHdl hdl) {
    ClientId id;
    if (forget(hdl, id)) {
      hub->on_client_disconnected(id);
    }
  }

  void on_fail(ConnectionHdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = server.get_con_from_hdl(hdl, ec);
    if (!ec) {
      spdlog::warn("Connection from {} failed: {}", con->get_remote_endpoint(),
                   con->get_ec().message());
    }
    on_close(hdl);
  }

  void on_frame(ConnectionHdl hdl, Server::message_ptr msg) {
    ClientId id;
    if (!lookup_id(hdl, id)) {
      return;
    }
    hub->on_message(id, msg->get_payload());
  }

  void heartbeat(ConnectionHdl hdl) {
    ClientId id;
    if (lookup_id(hdl, id)) {
      hub->on_client_heartbeat(id);
    }
  }

  // ========================================================================
  // Keepalive
  // ========================================================================

  void schedule_ping() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!running.load()) {
      return;
    }
    ping_timer = server.set_timer(
        static_cast<long>(ping_interval.count()),
        [this](const websocketpp::lib::error_code &ec) {
          if (ec || !running.load()) {
            return;
          }
          ping_all();
          schedule_ping();
        });
  }

  void ping_all() {
    std::vector<ConnectionHdl> open;
    {
      std::lock_guard<std::mutex> lock(mutex);
      for (const auto &entry : connections) {
        open.push_back(entry.second);
      }
    }

    websocketpp::lib::error_code ec;
    for (auto &hdl : open) {
      server.ping(hdl, "", ec);
      if (ec) {
        spdlog::debug("Ping failed: {}", ec.message());
      }
    }
  }

  void cancel_ping() {
    std::lock_guard<std::mutex> lock(mutex);
    if (!ping_timer) {
      return;
    }
    try {
      ping_timer->cancel();
    } catch (const std::exception &e) {
      spdlog::debug("Ping timer cancel: {}", e.what());
    }
    ping_timer.reset();
  }

  // ========================================================================
  // Event Loop
  // ========================================================================

  void run_loop() {
    try {
      server.run();
    } catch (const std::exception &e) {
      spdlog::error("Event loop stopped: {}", e.what());
    }
  }
};

WsServer::WsServer() : impl_(std::make_unique<Impl>()) {}

WsServer::~WsServer() { stop(); }

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> WsServer::start(const SyncBoardConfig &config, BroadcastHub &hub) {
  if (impl_->running.load()) {
    return Error(ErrorCode::AlreadyInitialized, "Server already running");
  }

  SYNCBOARD_TRY(check_port_free(config.bind_address, config.ws_port));

  // Address already validated by check_port_free
  boost::system::error_code address_ec;
  boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(config.bind_address, address_ec),
      config.ws_port);

  impl_->hub = &hub;
  impl_->max_outbound_buffer_bytes = config.max_outbound_buffer_bytes;
  impl_->ping_interval = ping_interval_for(config);

  websocketpp::lib::error_code ec;
  if (!impl_->asio_initialized) {
    impl_->server.init_asio(ec);
    if (ec) {
      return Error(ErrorCode::PlatformError, "Cannot initialize Asio",
                   ec.message());
    }
    impl_->asio_initialized = true;
  } else {
    impl_->server.reset();
  }

  impl_->server.listen(endpoint, ec);
  if (ec) {
    return Error(ErrorCode::PlatformError, "Cannot listen", ec.message());
  }

  impl_->server.start_accept(ec);
  if (ec) {
    websocketpp::lib::error_code ignored;
    impl_->server.stop_listening(ignored);
    return Error(ErrorCode::PlatformError, "Cannot accept", ec.message());
  }

  impl_->running.store(true);
  impl_->schedule_ping();
  for (uint32_t i = 0; i < config.io_threads; ++i) {
    impl_->threads.emplace_back([this]() { impl_->run_loop(); });
  }

  spdlog::info("WebSocket listening on {}:{}{} ({} I/O threads)",
               config.bind_address, port(), WEBSOCKET_PATH, config.io_threads);
  return Result<void>::ok();
}

void WsServer::stop() {
  if (!impl_->running.exchange(false)) {
    return;
  }

  impl_->cancel_ping();

  websocketpp::lib::error_code ec;
  impl_->server.stop_listening(ec);
  if (ec) {
    spdlog::debug("stop_listening: {}", ec.message());
  }

  std::vector<ConnectionHdl> open;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (const auto &entry : impl_->connections) {
      open.push_back(entry.second);
    }
  }
  for (auto &hdl : open) {
    impl_->server.close(hdl, websocketpp::close::status::going_away,
                        "server shutdown", ec);
  }

  auto deadline = std::chrono::steady_clock::now() + SHUTDOWN_GRACE;
  while (connection_count() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  impl_->server.stop();
  for (auto &thread : impl_->threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  impl_->threads.clear();

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->connections.clear();
    impl_->client_ids.clear();
  }
  spdlog::info("Server stopped");
}

bool WsServer::is_running() const { return impl_->running.load(); }

uint16_t WsServer::port() const {
  if (!impl_->running.load()) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = impl_->server.get_local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

size_t WsServer::connection_count() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->connections.size();
}

// ============================================================================
// Transport
// ============================================================================

Result<void> WsServer::send_to(const ClientId &id, const Event &event) {
  ConnectionHdl hdl;
  if (!impl_->lookup_handle(id, hdl)) {
    return Error(ErrorCode::TransportFailure, "No connection", id);
  }

  websocketpp::lib::error_code ec;
  auto con = impl_->server.get_con_from_hdl(hdl, ec);
  if (ec) {
    return Error(ErrorCode::TransportFailure, "Connection gone", id);
  }
  if (con->get_state() != websocketpp::session::state::open) {
    return Error(ErrorCode::TransportFailure, "Connection not open", id);
  }

  const std::string frame = encode_event(event);
  if (con->get_buffered_amount() + frame.size() >
      impl_->max_outbound_buffer_bytes) {
    return Error(ErrorCode::TransportFailure, "Outbound buffer full",
                 id + " (" + format_size(con->get_buffered_amount()) +
                     " pending)");
  }

  ec = con->send(frame, websocketpp::frame::opcode::text);
  if (ec) {
    return Error(ErrorCode::TransportFailure, "Send failed", ec.message());
  }
  return Result<void>::ok();
}

void WsServer::close(const ClientId &id, const std::string &reason) {
  ConnectionHdl hdl;
  if (!impl_->lookup_handle(id, hdl)) {
    return;
  }

  websocketpp::lib::error_code ec;
  impl_->server.close(hdl, websocketpp::close::status::policy_violation, reason,
                      ec);
  if (ec) {
    spdlog::debug("Close of {} failed: {}", id, ec.message());
  }
}

// ============================================================================
// Helpers
// ============================================================================

std::chrono::milliseconds ping_interval_for(const SyncBoardConfig &config) {
  if (config.client_timeout_seconds == 0) {
    return UNREAPED_PING_INTERVAL;
  }
  std::chrono::milliseconds timeout =
      std::chrono::seconds(config.client_timeout_seconds);
  std::chrono::milliseconds quarter = timeout / 4;
  return std::max(quarter, MIN_PING_INTERVAL);
}

Result<void> check_port_free(const std::string &bind_address, uint16_t port) {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(bind_address, ec);
  if (ec) {
    return Error(ErrorCode::ConfigError, "Invalid bind address", bind_address);
  }
  if (port == 0) {
    return Result<void>::ok();
  }

  // Both servers report every bind failure the same way; binding here first
  // lets a taken port be reported as such
  boost::asio::io_context io_context;
  boost::asio::ip::tcp::acceptor acceptor(io_context);
  boost::asio::ip::tcp::endpoint endpoint(address, port);
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor.bind(endpoint, ec);
  }
  boost::system::error_code ignored;
  acceptor.close(ignored);
  if (ec == boost::asio::error::address_in_use) {
    return Error(ErrorCode::AddressInUse, "Port already in use",
                 bind_address + ":" + std::to_string(port));
  }
  return Result<void>::ok();
}

std::string get_local_address() {
  boost::asio::io_context io_context;
  boost::asio::ip::udp::socket socket(io_context);
  boost::system::error_code ec;

  // UDP connect sends nothing; it only selects the outgoing interface
  socket.connect(boost::asio::ip::udp::endpoint(
                     boost::asio::ip::make_address_v4("8.8.8.8"), 53),
                 ec);
  if (ec) {
    return "127.0.0.1";
  }

  auto endpoint = socket.local_endpoint(ec);
  if (ec) {
    return "127.0.0.1";
  }
  return endpoint.address().to_string();
}

} // namespace syncboard
