/**
 * @file http_server.cpp
 * @brief cpp-httplib implementation of the file endpoints
 */

#include "syncboard/http_server.h"
#include "syncboard/http.h"
#include "syncboard/server.h"
#include "syncboard/syncboard.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace syncboard {

namespace {

/// Request handler threads per configured I/O thread
constexpr size_t HTTP_WORKERS_PER_IO_THREAD = 4;

void respond(httplib::Response &res, int status, const std::string &body,
             const char *content_type = "application/json") {
  res.status = status;
  if (!body.empty()) {
    res.set_content(body, content_type);
  }
}

void respond_error(httplib::Response &res, const Error &error) {
  respond(res, http_status_for(error.code), error_body(error));
}

void method_not_allowed(httplib::Response &res, const char *allow) {
  res.set_header("Allow", allow);
  respond(res, 405,
          error_body(Error(ErrorCode::InvalidArgument, "Method not allowed",
                           std::string("Use ") + allow)));
}

ClientId requesting_client(const httplib::Request &req) {
  if (req.has_header("X-Client-Id")) {
    return req.get_header_value("X-Client-Id");
  }
  return req.get_param_value("client");
}

/// Catch anything a route throws and answer 500
httplib::Server::Handler guarded(const char *route,
                                 httplib::Server::Handler handler) {
  return [route, handler](const httplib::Request &req,
                          httplib::Response &res) {
    try {
      handler(req, res);
    } catch (const std::exception &e) {
      spdlog::error("HTTP {} {} failed: {}", req.method, route, e.what());
      respond_error(res, Error(ErrorCode::Unknown, "Internal error"));
    }
  };
}

} // namespace

// ============================================================================
// HttpServer Implementation
// ============================================================================

class HttpServer::Impl {
public:
  std::mutex mutex;
  std::unique_ptr<httplib::Server> server;
  std::thread server_thread;
  std::atomic<bool> running{false};
  uint16_t bound_port = 0;
  BroadcastHub *hub = nullptr;

  void configure_routes(httplib::Server &server) {
    server.Post("/upload", guarded("/upload", [this](const httplib::Request &req,
                                                     httplib::Response &res) {
                  handle_upload(req, res);
                }));
    server.Get("/upload", [](const httplib::Request &, httplib::Response &res) {
      method_not_allowed(res, "POST");
    });

    server.Get("/files", guarded("/files", [this](const httplib::Request &,
                                                  httplib::Response &res) {
                 respond(res, 200, encode_file_list(hub->board().files().list()));
               }));

    server.Get(R"(/files/([^/]+))",
               guarded("/files/<id>", [this](const httplib::Request &req,
                                             httplib::Response &res) {
                 handle_download(req, res, req.matches[1]);
               }));
    server.Delete(R"(/files/([^/]+))",
                  guarded("/files/<id>", [this](const httplib::Request &req,
                                                httplib::Response &res) {
                    handle_delete(req, res, req.matches[1]);
                  }));
    server.Post(R"(/files(/[^/]*)?)",
                [](const httplib::Request &, httplib::Response &res) {
                  method_not_allowed(res, "GET, DELETE");
                });

    server.Get("/health", [this](const httplib::Request &,
                                 httplib::Response &res) {
      const auto &board = hub->board();
      respond(res, 200,
              health_body(board.clients().count(), board.files().count()));
    });

    server.set_logger([](const httplib::Request &req,
                         const httplib::Response &res) {
      spdlog::debug("HTTP {} {} from {} -> {}", req.method, req.path,
                    req.remote_addr, res.status);
    });
  }

  void handle_upload(const httplib::Request &req, httplib::Response &res) {
    std::string filename;
    std::string mime_type;
    Bytes data;

    if (req.is_multipart_form_data()) {
      // First field carrying a filename; plain form fields are ignored
      auto file = std::find_if(
          req.files.begin(), req.files.end(),
          [](const auto &field) { return !field.second.filename.empty(); });
      if (file == req.files.end()) {
        respond_error(res, Error(ErrorCode::InvalidArgument,
                                 "No file in multipart body"));
        return;
      }
      filename = file->second.filename;
      mime_type = file->second.content_type;
      data.assign(file->second.content.begin(), file->second.content.end());
    } else {
      filename = req.has_header("X-Filename") ? req.get_header_value("X-Filename")
                                              : req.get_param_value("filename");
      mime_type = req.get_header_value("Content-Type");
      data.assign(req.body.begin(), req.body.end());
    }

    auto stored = hub->on_file_upload(requesting_client(req), filename,
                                      mime_type, std::move(data));
    if (stored.is_error()) {
      respond_error(res, stored.error());
      return;
    }
    respond(res, 200, upload_body(stored.value()));
  }

  void handle_download(const httplib::Request &req, httplib::Response &res,
                       const FileId &file_id) {
    auto entry = hub->on_file_download_request(file_id);
    if (entry.is_error()) {
      respond_error(res, entry.error());
      return;
    }

    const FileMeta &meta = entry.value().meta;
    const std::string etag = entity_tag(meta);
    res.set_header("ETag", etag);

    if (req.get_header_value("If-None-Match") == etag) {
      res.status = 304;
      return;
    }

    res.set_header("Content-Disposition", content_disposition(meta.filename));
    res.status = 200;

    // The provider holds the shared buffer, so a concurrent sweep cannot
    // free it mid-transfer
    SharedBytes data = entry.value().data;
    res.set_content_provider(
        data->size(), meta.mime_type.c_str(),
        [data](size_t offset, size_t length, httplib::DataSink &sink) {
          return sink.write(
              reinterpret_cast<const char *>(data->data()) + offset, length);
        });
  }

  void handle_delete(const httplib::Request &req, httplib::Response &res,
                     const FileId &file_id) {
    auto deleted = hub->on_file_delete(requesting_client(req), file_id);
    if (deleted.is_error()) {
      respond_error(res, deleted.error());
      return;
    }
    res.status = 204;
  }

  void join() {
    if (server_thread.joinable()) {
      server_thread.join();
    }
  }
};

HttpServer::HttpServer() : impl_(std::make_unique<Impl>()) {}

HttpServer::~HttpServer() { stop(); }

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> HttpServer::start(const SyncBoardConfig &config,
                               BroadcastHub &hub) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  if (impl_->server) {
    return Error(ErrorCode::AlreadyInitialized, "HTTP server already running");
  }

  SYNCBOARD_TRY(check_port_free(config.bind_address, config.port));

  impl_->hub = &hub;
  impl_->server = std::make_unique<httplib::Server>();
  impl_->configure_routes(*impl_->server);
  impl_->server->set_payload_max_length(config.max_file_size_bytes +
                                        MULTIPART_OVERHEAD);

  const size_t workers =
      std::max<size_t>(config.io_threads, 1) * HTTP_WORKERS_PER_IO_THREAD;
  impl_->server->new_task_queue = [workers] {
    return new httplib::ThreadPool(workers);
  };

  int bound_port = config.port;
  if (config.port == 0) {
    bound_port = impl_->server->bind_to_any_port(config.bind_address);
  } else if (!impl_->server->bind_to_port(config.bind_address, config.port)) {
    bound_port = -1;
  }
  if (bound_port < 0) {
    impl_->server.reset();
    return Error(ErrorCode::PlatformError, "Cannot bind HTTP server",
                 config.bind_address + ":" + std::to_string(config.port));
  }

  impl_->bound_port = static_cast<uint16_t>(bound_port);
  impl_->running.store(true);

  httplib::Server *server = impl_->server.get();
  impl_->server_thread = std::thread([this, server]() {
    if (!server->listen_after_bind()) {
      spdlog::error("HTTP server stopped listening");
    }
    impl_->running.store(false);
  });

  lock.unlock();
  server->wait_until_ready();
  lock.lock();

  if (!server->is_running()) {
    server->stop();
    lock.unlock();
    impl_->join();
    lock.lock();
    impl_->server.reset();
    impl_->bound_port = 0;
    impl_->running.store(false);
    return Error(ErrorCode::PlatformError, "HTTP server failed to listen");
  }

  spdlog::info("HTTP listening on {}:{}", config.bind_address,
               impl_->bound_port);
  return Result<void>::ok();
}

void HttpServer::stop() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  if (!impl_->server) {
    return;
  }
  impl_->server->stop();
  lock.unlock();
  impl_->join();
  lock.lock();
  impl_->server.reset();
  impl_->bound_port = 0;
  impl_->running.store(false);
  spdlog::info("HTTP server stopped");
}

bool HttpServer::is_running() const { return impl_->running.load(); }

uint16_t HttpServer::port() const { return impl_->bound_port; }

} // namespace syncboard
