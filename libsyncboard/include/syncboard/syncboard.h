/**
 * @file syncboard.h
 * @brief Main SyncBoard API Header
 *
 * SyncBoard - a LAN clipboard relay.
 *
 * Every device that opens the board sees the same clipboard text and the
 * same set of shared files, updated in real time. Nothing is written to
 * disk; files expire after a configurable time-to-live.
 *
 * Quick Start:
 * @code
 *   #include <syncboard/syncboard.h>
 *
 *   syncboard::ConfigManager config;
 *   config.parse_command_line(argc, argv);
 *
 *   syncboard::Board board(config.get().board_config());
 *   syncboard::WsServer server;
 *   syncboard::BroadcastHub hub(board, server);
 *   server.start(config.get(), hub);
 * @endcode
 */

#ifndef SYNCBOARD_SYNCBOARD_H
#define SYNCBOARD_SYNCBOARD_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "board.h"
#include "clipboard_state.h"
#include "config.h"
#include "connection_registry.h"
#include "file_store.h"
#include "http.h"
#include "http_server.h"
#include "hub.h"
#include "logging.h"
#include "protocol.h"
#include "security.h"
#include "server.h"
#include "sweeper.h"
#include "transport.h"

namespace syncboard {

// ============================================================================
// Version Information
// ============================================================================

/// SyncBoard major version
constexpr int VERSION_MAJOR = 1;

/// SyncBoard minor version
constexpr int VERSION_MINOR = 0;

/// SyncBoard patch version
constexpr int VERSION_PATCH = 0;

/// SyncBoard version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
};

SYNCBOARD_API VersionInfo get_version();

} // namespace syncboard

#endif // SYNCBOARD_SYNCBOARD_H
