/**
 * @file config.h
 * @brief Server configuration for SyncBoard
 *
 * Configuration is layered: built-in defaults, then an optional JSON file,
 * then command-line flags. Later layers win.
 */

#ifndef SYNCBOARD_CONFIG_H
#define SYNCBOARD_CONFIG_H

#include "board.h"
#include "error.h"
#include "platform.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace syncboard {

// ============================================================================
// Defaults
// ============================================================================

/// Default HTTP port
constexpr uint16_t DEFAULT_PORT = 56321;

/// Default WebSocket port
constexpr uint16_t DEFAULT_WS_PORT = 56322;

/// Default file time-to-live (1 hour)
constexpr uint32_t DEFAULT_FILE_TTL_SECONDS = 3600;

/// Default per-file size limit (100 MiB)
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 100ull * 1024 * 1024;

/// Default clipboard text size limit (4 MiB)
constexpr uint64_t DEFAULT_MAX_TEXT_SIZE = 4ull * 1024 * 1024;

/// Default aggregate file storage cap (512 MiB)
constexpr uint64_t DEFAULT_MAX_TOTAL_SIZE = 512ull * 1024 * 1024;

/// Default sweep interval (1 minute)
constexpr uint32_t DEFAULT_SWEEP_INTERVAL_SECONDS = 60;

/// Default client liveness timeout (0 disables reaping)
constexpr uint32_t DEFAULT_CLIENT_TIMEOUT_SECONDS = 120;

/// Default number of event-loop threads
constexpr uint32_t DEFAULT_IO_THREADS = 2;

/// Default per-connection outbound buffer limit (16 MiB)
constexpr uint64_t DEFAULT_MAX_OUTBOUND_BUFFER = 16ull * 1024 * 1024;

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Complete configuration for a SyncBoard server
 */
struct SyncBoardConfig {
  // ========================================================================
  // Network
  // ========================================================================

  /// TCP port for the HTTP file endpoints
  uint16_t port = DEFAULT_PORT;

  /// TCP port for WebSocket connections
  uint16_t ws_port = DEFAULT_WS_PORT;

  /// Address to bind ("0.0.0.0" = all interfaces)
  std::string bind_address = "0.0.0.0";

  /// Threads running the WebSocket event loop (and HTTP workers)
  uint32_t io_threads = DEFAULT_IO_THREADS;

  /// Drop a connection whose unsent data exceeds this many bytes
  uint64_t max_outbound_buffer_bytes = DEFAULT_MAX_OUTBOUND_BUFFER;

  // ========================================================================
  // Board
  // ========================================================================

  /// How long an uploaded file stays downloadable
  uint32_t file_ttl_seconds = DEFAULT_FILE_TTL_SECONDS;

  /// Largest accepted upload
  uint64_t max_file_size_bytes = DEFAULT_MAX_FILE_SIZE;

  /// Largest accepted clipboard text
  uint64_t max_text_size_bytes = DEFAULT_MAX_TEXT_SIZE;

  /// Cap on the sum of all stored files
  uint64_t max_total_bytes = DEFAULT_MAX_TOTAL_SIZE;

  /// Period of the expiry sweep
  uint32_t sweep_interval_seconds = DEFAULT_SWEEP_INTERVAL_SECONDS;

  /// Disconnect clients silent for this long (0 = never)
  uint32_t client_timeout_seconds = DEFAULT_CLIENT_TIMEOUT_SECONDS;

  // ========================================================================
  // Diagnostics
  // ========================================================================

  /// spdlog level name
  std::string log_level = "info";

  /// JSON file the configuration was loaded from (empty = none)
  std::filesystem::path config_file_path;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its built-in default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Extract the settings the Board needs
  BoardConfig board_config() const;
};

// ============================================================================
// Command Line
// ============================================================================

/**
 * @brief What the command line asked the program to do
 */
struct CommandLine {
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Usage text for the server executable
 */
SYNCBOARD_API std::string command_line_usage(const std::string &program);

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Loads, layers and validates configuration
 *
 * Example:
 * @code
 *   ConfigManager manager;
 *   auto cli = manager.parse_command_line(argc, argv);
 *   if (cli.is_error()) { ... }
 *   const SyncBoardConfig &config = manager.get();
 * @endcode
 */
class SYNCBOARD_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Loading
  // ========================================================================

  /**
   * @brief Overlay settings from a JSON document
   * @param json_text JSON object; unknown keys are ignored
   * @return ConfigError on malformed JSON or wrongly-typed values
   *
   * On error the current configuration is left unchanged.
   */
  Result<void> load_json(const std::string &json_text);

  /**
   * @brief Overlay settings from a JSON file
   * @return ConfigFileNotFound if the file cannot be opened
   */
  Result<void> load_file(const std::filesystem::path &path);

  /**
   * @brief Apply command-line flags
   *
   * `--config PATH` is loaded first, so explicit flags override the file
   * regardless of their position. The merged result is validated.
   */
  Result<CommandLine> parse_command_line(int argc, const char *const argv[]);

  // ========================================================================
  // Access
  // ========================================================================

  /// Get current configuration
  const SyncBoardConfig &get() const;

  /// Replace the configuration (validated first)
  Result<void> set(const SyncBoardConfig &config);

  /// Reset to defaults
  void reset_defaults();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_CONFIG_H
