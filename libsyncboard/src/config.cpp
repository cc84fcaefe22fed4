/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "syncboard/config.h"
#include "syncboard/logging.h"
#include "syncboard/types.h"

namespace fs = ::std::filesystem;

namespace syncboard {

namespace {

using json = nlohmann::json;

// Parse a decimal unsigned integer no larger than `max`
bool parse_unsigned(const std::string &text, uint64_t max, uint64_t &out) {
  if (text.empty() || text[0] == '-' || text[0] == '+') {
    return false;
  }
  errno = 0;
  char *end = nullptr;
  unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0' || value > max) {
    return false;
  }
  out = value;
  return true;
}

// Read an unsigned JSON field into `out` when present
template <typename T>
Result<void> read_unsigned(const json &doc, const char *key, T &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > std::numeric_limits<T>::max()) {
    return Error(ErrorCode::ConfigError,
                 std::string("'") + key + "' must be a non-negative integer",
                 it->dump());
  }
  out = static_cast<T>(it->get<uint64_t>());
  return Result<void>::ok();
}

Result<void> read_string(const json &doc, const char *key, std::string &out) {
  auto it = doc.find(key);
  if (it == doc.end()) {
    return Result<void>::ok();
  }
  if (!it->is_string()) {
    return Error(ErrorCode::ConfigError,
                 std::string("'") + key + "' must be a string", it->dump());
  }
  out = it->get<std::string>();
  return Result<void>::ok();
}

template <typename T>
Result<void> flag_unsigned(const std::string &flag, const std::string &value,
                           T &out) {
  uint64_t parsed = 0;
  if (!parse_unsigned(value, std::numeric_limits<T>::max(), parsed)) {
    return Error(ErrorCode::ConfigError,
                 flag + " expects a non-negative integer", value);
  }
  out = static_cast<T>(parsed);
  return Result<void>::ok();
}

} // namespace

// ============================================================================
// SyncBoardConfig Methods
// ============================================================================

void SyncBoardConfig::load_defaults() {
  port = DEFAULT_PORT;
  ws_port = DEFAULT_WS_PORT;
  bind_address = "0.0.0.0";
  io_threads = DEFAULT_IO_THREADS;
  max_outbound_buffer_bytes = DEFAULT_MAX_OUTBOUND_BUFFER;

  file_ttl_seconds = DEFAULT_FILE_TTL_SECONDS;
  max_file_size_bytes = DEFAULT_MAX_FILE_SIZE;
  max_text_size_bytes = DEFAULT_MAX_TEXT_SIZE;
  max_total_bytes = DEFAULT_MAX_TOTAL_SIZE;
  sweep_interval_seconds = DEFAULT_SWEEP_INTERVAL_SECONDS;
  client_timeout_seconds = DEFAULT_CLIENT_TIMEOUT_SECONDS;

  log_level = "info";
  config_file_path.clear();
}

Result<void> SyncBoardConfig::validate() const {
  if (bind_address.empty()) {
    return Error(ErrorCode::ConfigError, "Bind address must not be empty");
  }

  if (port != 0 && port == ws_port) {
    return Error(ErrorCode::ConfigError,
                 "HTTP and WebSocket ports must differ", std::to_string(port));
  }

  if (io_threads == 0) {
    return Error(ErrorCode::ConfigError, "At least one I/O thread is required");
  }

  if (file_ttl_seconds == 0) {
    return Error(ErrorCode::ConfigError, "File TTL must be positive");
  }

  if (sweep_interval_seconds == 0) {
    return Error(ErrorCode::ConfigError, "Sweep interval must be positive");
  }

  if (max_file_size_bytes == 0 || max_text_size_bytes == 0 ||
      max_total_bytes == 0 || max_outbound_buffer_bytes == 0) {
    return Error(ErrorCode::ConfigError, "Size limits must be positive");
  }

  if (max_file_size_bytes > max_total_bytes) {
    return Error(ErrorCode::ConfigError,
                 "Per-file limit exceeds total storage cap",
                 format_size(max_file_size_bytes) + " > " +
                     format_size(max_total_bytes));
  }

  if (!is_valid_log_level(log_level)) {
    return Error(ErrorCode::ConfigError, "Unknown log level", log_level);
  }

  return Result<void>::ok();
}

BoardConfig SyncBoardConfig::board_config() const {
  BoardConfig board;
  board.files.ttl = std::chrono::seconds(file_ttl_seconds);
  board.files.max_file_size_bytes = max_file_size_bytes;
  board.files.max_total_bytes = max_total_bytes;
  board.max_text_size_bytes = max_text_size_bytes;
  board.client_timeout = std::chrono::seconds(client_timeout_seconds);
  return board;
}

// ============================================================================
// Command Line
// ============================================================================

std::string command_line_usage(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --config PATH          JSON configuration file\n"
      << "  --port N               HTTP port (default " << DEFAULT_PORT
      << ")\n"
      << "  --ws-port N            WebSocket port (default " << DEFAULT_WS_PORT
      << ")\n"
      << "  --bind ADDR            Bind address (default 0.0.0.0)\n"
      << "  --ttl SECONDS          File lifetime (default "
      << DEFAULT_FILE_TTL_SECONDS << ")\n"
      << "  --max-file-size BYTES  Largest upload (default "
      << DEFAULT_MAX_FILE_SIZE << ")\n"
      << "  --max-text-size BYTES  Largest clipboard text (default "
      << DEFAULT_MAX_TEXT_SIZE << ")\n"
      << "  --max-total BYTES      Total file storage (default "
      << DEFAULT_MAX_TOTAL_SIZE << ")\n"
      << "  --sweep-interval SEC   Expiry sweep period (default "
      << DEFAULT_SWEEP_INTERVAL_SECONDS << ")\n"
      << "  --client-timeout SEC   Drop silent clients, 0 = never (default "
      << DEFAULT_CLIENT_TIMEOUT_SECONDS << ")\n"
      << "  --threads N            I/O threads (default " << DEFAULT_IO_THREADS
      << ")\n"
      << "  --log-level LEVEL      trace, debug, info, warn, error, critical, "
         "off\n"
      << "  --help                 Show this help\n"
      << "  --version              Show version\n";
  return out.str();
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  SyncBoardConfig config;
  std::mutex mutex;

  static Result<void> overlay(const std::string &json_text,
                              SyncBoardConfig &config) {
    json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded()) {
      return Error(ErrorCode::ConfigError, "Configuration is not valid JSON");
    }
    if (!doc.is_object()) {
      return Error(ErrorCode::ConfigError,
                   "Configuration must be a JSON object");
    }

    SYNCBOARD_TRY(read_unsigned(doc, "port", config.port));
    SYNCBOARD_TRY(read_unsigned(doc, "ws_port", config.ws_port));
    SYNCBOARD_TRY(read_string(doc, "bind_address", config.bind_address));
    SYNCBOARD_TRY(read_unsigned(doc, "io_threads", config.io_threads));
    SYNCBOARD_TRY(read_unsigned(doc, "max_outbound_buffer_bytes",
                                config.max_outbound_buffer_bytes));
    SYNCBOARD_TRY(
        read_unsigned(doc, "file_ttl_seconds", config.file_ttl_seconds));
    SYNCBOARD_TRY(
        read_unsigned(doc, "max_file_size_bytes", config.max_file_size_bytes));
    SYNCBOARD_TRY(
        read_unsigned(doc, "max_text_size_bytes", config.max_text_size_bytes));
    SYNCBOARD_TRY(
        read_unsigned(doc, "max_total_bytes", config.max_total_bytes));
    SYNCBOARD_TRY(read_unsigned(doc, "sweep_interval_seconds",
                                config.sweep_interval_seconds));
    SYNCBOARD_TRY(read_unsigned(doc, "client_timeout_seconds",
                                config.client_timeout_seconds));
    SYNCBOARD_TRY(read_string(doc, "log_level", config.log_level));

    return Result<void>::ok();
  }

  static Result<std::string> read_file(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return Error(ErrorCode::ConfigFileNotFound,
                   "Cannot open configuration file", path.string());
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
  }

  static Result<void> overlay_file(const fs::path &path,
                                   SyncBoardConfig &config) {
    auto text = read_file(path);
    if (text.is_error()) {
      return text.error();
    }

    auto loaded = overlay(text.value(), config);
    if (loaded.is_error()) {
      Error error = loaded.error();
      error.details = path.string() + (error.details.empty() ? "" : ": ") +
                      error.details;
      return error;
    }
    config.config_file_path = path;
    return Result<void>::ok();
  }
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config.load_defaults();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::load_json(const std::string &json_text) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  SyncBoardConfig updated = impl_->config;
  SYNCBOARD_TRY(Impl::overlay(json_text, updated));
  impl_->config = updated;
  return Result<void>::ok();
}

Result<void> ConfigManager::load_file(const fs::path &path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  SyncBoardConfig updated = impl_->config;
  SYNCBOARD_TRY(Impl::overlay_file(path, updated));
  impl_->config = updated;
  return Result<void>::ok();
}

Result<CommandLine> ConfigManager::parse_command_line(int argc,
                                                      const char *const argv[]) {
  CommandLine command;

  // Split "--flag=value" and "--flag value" into (flag, value) pairs
  std::vector<std::pair<std::string, std::string>> flags;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      command.show_help = true;
      continue;
    }
    if (arg == "--version" || arg == "-v") {
      command.show_version = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      return Error(ErrorCode::ConfigError, "Unexpected argument", arg);
    }

    size_t eq = arg.find('=');
    if (eq != std::string::npos) {
      flags.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
    } else if (i + 1 < argc) {
      flags.emplace_back(arg, argv[++i]);
    } else {
      return Error(ErrorCode::ConfigError, "Missing value for " + arg);
    }
  }

  if (command.show_help || command.show_version) {
    return command;
  }

  // Nothing is committed until every file and flag has been applied
  std::lock_guard<std::mutex> lock(impl_->mutex);
  SyncBoardConfig updated = impl_->config;

  for (const auto &flag : flags) {
    if (flag.first == "--config") {
      SYNCBOARD_TRY(Impl::overlay_file(flag.second, updated));
    }
  }

  for (const auto &flag : flags) {
    const std::string &name = flag.first;
    const std::string &value = flag.second;

    if (name == "--config") {
      continue;
    } else if (name == "--port") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.port));
    } else if (name == "--ws-port") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.ws_port));
    } else if (name == "--bind") {
      updated.bind_address = value;
    } else if (name == "--ttl") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.file_ttl_seconds));
    } else if (name == "--max-file-size") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.max_file_size_bytes));
    } else if (name == "--max-text-size") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.max_text_size_bytes));
    } else if (name == "--max-total") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.max_total_bytes));
    } else if (name == "--sweep-interval") {
      SYNCBOARD_TRY(
          flag_unsigned(name, value, updated.sweep_interval_seconds));
    } else if (name == "--client-timeout") {
      SYNCBOARD_TRY(
          flag_unsigned(name, value, updated.client_timeout_seconds));
    } else if (name == "--threads") {
      SYNCBOARD_TRY(flag_unsigned(name, value, updated.io_threads));
    } else if (name == "--log-level") {
      updated.log_level = value;
    } else {
      return Error(ErrorCode::ConfigError, "Unknown option", name);
    }
  }

  SYNCBOARD_TRY(updated.validate());
  impl_->config = updated;
  return command;
}

const SyncBoardConfig &ConfigManager::get() const { return impl_->config; }

Result<void> ConfigManager::set(const SyncBoardConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

} // namespace syncboard
