/**
 * @file protocol.h
 * @brief SyncBoard wire protocol definitions
 *
 * Every WebSocket frame is one JSON object with a "type" member. Clients
 * send intents; the server sends events. Timestamps are integer
 * milliseconds since the Unix epoch.
 *
 * Intents:
 *   {"type":"text","content":S,"version":N}
 *   {"type":"file_meta_request"}
 *   {"type":"file_delete","id":S}
 *   {"type":"clear"}
 *   {"type":"ping"}
 *
 * Events:
 *   {"type":"text_update","content","version","updatedBy","updatedAt"}
 *   {"type":"file_added","id","filename","mimeType","sizeBytes","uploadedAt"}
 *   {"type":"file_removed","id"}
 *   {"type":"presence","count"}
 *   {"type":"welcome","clientId","serverVersion"}
 *   {"type":"file_list","files":[...]}
 *   {"type":"text_rejected","reason","content","version","updatedBy","updatedAt"}
 *   {"type":"error","code","message"}
 *   {"type":"pong"}
 */

#ifndef SYNCBOARD_PROTOCOL_H
#define SYNCBOARD_PROTOCOL_H

#include "syncboard/clipboard_state.h"
#include "syncboard/error.h"
#include "syncboard/file_store.h"
#include "syncboard/types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace syncboard {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Largest accepted WebSocket frame; text limits are enforced separately
constexpr size_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

// ============================================================================
// Message Types
// ============================================================================

/**
 * @brief Protocol message type identifiers
 */
enum class MessageType : uint8_t {
  // ---- Intents (client -> server) ----
  /// Submit clipboard text
  Text = 0x01,
  /// Ask for the list of stored files
  FileMetaRequest = 0x02,
  /// Delete a stored file
  FileDelete = 0x03,
  /// Clear text and files
  Clear = 0x04,
  /// Heartbeat
  Ping = 0x05,

  // ---- Broadcast events (server -> all) ----
  /// Clipboard text changed
  TextUpdate = 0x10,
  /// A file was stored
  FileAdded = 0x11,
  /// A file was removed or expired
  FileRemoved = 0x12,
  /// Number of connected clients changed
  Presence = 0x13,

  // ---- Unicast events (server -> one client) ----
  /// Greeting with the assigned client id
  Welcome = 0x20,
  /// Metadata of all stored files
  FileList = 0x21,
  /// Text submission lost a version race
  TextRejected = 0x22,
  /// A request failed
  ErrorNotice = 0x23,
  /// Heartbeat reply
  Pong = 0x24
};

/**
 * @brief Wire name of a message type ("text_update", ...)
 */
SYNCBOARD_API const char *message_type_name(MessageType type);

/**
 * @brief Parse a wire name back to a message type
 */
SYNCBOARD_API std::optional<MessageType>
message_type_from_name(const std::string &name);

// ============================================================================
// Intents
// ============================================================================

struct TextIntent {
  std::string content;
  /// Version the client's edit is based on
  uint64_t version = 0;
};

struct FileMetaRequestIntent {};

struct FileDeleteIntent {
  FileId id;
};

struct ClearIntent {};

struct PingIntent {};

using Intent = std::variant<TextIntent, FileMetaRequestIntent,
                            FileDeleteIntent, ClearIntent, PingIntent>;

/**
 * @brief Parse one client frame
 * @return MalformedMessage if it is not a JSON object with the fields its
 *         type needs, UnknownMessageType if the type is not an intent
 */
SYNCBOARD_API Result<Intent> decode_intent(const std::string &frame);

// ============================================================================
// Events
// ============================================================================

struct TextUpdatedEvent {
  ClipboardText text;
};

struct FileAddedEvent {
  FileMeta file;
};

struct FileRemovedEvent {
  FileId id;
};

struct PresenceChangedEvent {
  size_t client_count = 0;
};

struct WelcomeEvent {
  ClientId client_id;
  std::string server_version;
};

struct FileListEvent {
  std::vector<FileMeta> files;
};

/// Sent to the loser of a version race, carrying the winning state
struct TextRejectedEvent {
  ClipboardText current;
};

struct ErrorEvent {
  ErrorCode code = ErrorCode::Unknown;
  std::string message;
};

struct PongEvent {};

using Event =
    std::variant<TextUpdatedEvent, FileAddedEvent, FileRemovedEvent,
                 PresenceChangedEvent, WelcomeEvent, FileListEvent,
                 TextRejectedEvent, ErrorEvent, PongEvent>;

/**
 * @brief Message type of an event
 */
SYNCBOARD_API MessageType event_type(const Event &event);

/**
 * @brief Serialize an event to its JSON frame
 *
 * Content that is not valid UTF-8 is emitted with U+FFFD replacements.
 */
SYNCBOARD_API std::string encode_event(const Event &event);

/**
 * @brief JSON text for a list of file metadata (used by GET /files)
 */
SYNCBOARD_API std::string encode_file_list(const std::vector<FileMeta> &files);

} // namespace syncboard

#endif // SYNCBOARD_PROTOCOL_H
