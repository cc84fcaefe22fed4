/**
 * @file protocol.cpp
 * @brief JSON wire codec
 */

#include "syncboard/protocol.h"
#include <array>
#include <nlohmann/json.hpp>
#include <utility>

using json = nlohmann::json;

namespace syncboard {

// ============================================================================
// Message Type Names
// ============================================================================

namespace {

const std::array<std::pair<MessageType, const char *>, 14> kTypeNames = {{
    {MessageType::Text, "text"},
    {MessageType::FileMetaRequest, "file_meta_request"},
    {MessageType::FileDelete, "file_delete"},
    {MessageType::Clear, "clear"},
    {MessageType::Ping, "ping"},
    {MessageType::TextUpdate, "text_update"},
    {MessageType::FileAdded, "file_added"},
    {MessageType::FileRemoved, "file_removed"},
    {MessageType::Presence, "presence"},
    {MessageType::Welcome, "welcome"},
    {MessageType::FileList, "file_list"},
    {MessageType::TextRejected, "text_rejected"},
    {MessageType::ErrorNotice, "error"},
    {MessageType::Pong, "pong"},
}};

} // namespace

const char *message_type_name(MessageType type) {
  for (const auto &entry : kTypeNames) {
    if (entry.first == type) {
      return entry.second;
    }
  }
  return "unknown";
}

std::optional<MessageType> message_type_from_name(const std::string &name) {
  for (const auto &entry : kTypeNames) {
    if (name == entry.second) {
      return entry.first;
    }
  }
  return std::nullopt;
}

// ============================================================================
// Intent Decoding
// ============================================================================

namespace {

Error malformed(const std::string &what) {
  return Error(ErrorCode::MalformedMessage, "Malformed message", what);
}

Result<std::string> require_string(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return malformed(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

} // namespace

Result<Intent> decode_intent(const std::string &frame) {
  json doc = json::parse(frame, nullptr, false);
  if (doc.is_discarded()) {
    return malformed("not valid JSON");
  }
  if (!doc.is_object()) {
    return malformed("not a JSON object");
  }

  auto type_name = require_string(doc, "type");
  if (type_name.is_error()) {
    return type_name.error();
  }

  auto type = message_type_from_name(type_name.value());
  if (!type) {
    return Error(ErrorCode::UnknownMessageType, "Unknown message type",
                 type_name.value());
  }

  switch (*type) {
  case MessageType::Text: {
    auto content = require_string(doc, "content");
    if (content.is_error()) {
      return content.error();
    }
    auto version = doc.find("version");
    if (version == doc.end() || !version->is_number_integer() ||
        (!version->is_number_unsigned() && version->get<int64_t>() < 0)) {
      return malformed("'version' must be a non-negative integer");
    }
    TextIntent intent;
    intent.content = std::move(content.value());
    intent.version = version->get<uint64_t>();
    return Intent(std::move(intent));
  }

  case MessageType::FileMetaRequest:
    return Intent(FileMetaRequestIntent{});

  case MessageType::FileDelete: {
    auto id = require_string(doc, "id");
    if (id.is_error()) {
      return id.error();
    }
    return Intent(FileDeleteIntent{std::move(id.value())});
  }

  case MessageType::Clear:
    return Intent(ClearIntent{});

  case MessageType::Ping:
    return Intent(PingIntent{});

  default:
    // A server event echoed back is not something a client may send
    return Error(ErrorCode::UnknownMessageType, "Not a client message",
                 type_name.value());
  }
}

// ============================================================================
// Event Encoding
// ============================================================================

namespace {

json text_json(const ClipboardText &text) {
  json j;
  j["content"] = text.content;
  j["version"] = text.version;
  j["updatedBy"] = text.updated_by;
  j["updatedAt"] = to_unix_millis(text.updated_at);
  return j;
}

json file_json(const FileMeta &file) {
  json j;
  j["id"] = file.id;
  j["filename"] = file.filename;
  j["mimeType"] = file.mime_type;
  j["sizeBytes"] = file.size_bytes;
  j["uploadedAt"] = to_unix_millis(file.uploaded_at);
  return j;
}

struct EventEncoder {
  json operator()(const TextUpdatedEvent &e) const { return text_json(e.text); }

  json operator()(const FileAddedEvent &e) const { return file_json(e.file); }

  json operator()(const FileRemovedEvent &e) const {
    json j;
    j["id"] = e.id;
    return j;
  }

  json operator()(const PresenceChangedEvent &e) const {
    json j;
    j["count"] = e.client_count;
    return j;
  }

  json operator()(const WelcomeEvent &e) const {
    json j;
    j["clientId"] = e.client_id;
    j["serverVersion"] = e.server_version;
    return j;
  }

  json operator()(const FileListEvent &e) const {
    json j;
    j["files"] = json::array();
    for (const auto &file : e.files) {
      j["files"].push_back(file_json(file));
    }
    return j;
  }

  json operator()(const TextRejectedEvent &e) const {
    json j = text_json(e.current);
    j["reason"] = "stale_version";
    return j;
  }

  json operator()(const ErrorEvent &e) const {
    json j;
    j["code"] = error_code_name(e.code);
    j["message"] = e.message;
    return j;
  }

  json operator()(const PongEvent &) const { return json::object(); }
};

struct EventTyper {
  MessageType operator()(const TextUpdatedEvent &) const {
    return MessageType::TextUpdate;
  }
  MessageType operator()(const FileAddedEvent &) const {
    return MessageType::FileAdded;
  }
  MessageType operator()(const FileRemovedEvent &) const {
    return MessageType::FileRemoved;
  }
  MessageType operator()(const PresenceChangedEvent &) const {
    return MessageType::Presence;
  }
  MessageType operator()(const WelcomeEvent &) const {
    return MessageType::Welcome;
  }
  MessageType operator()(const FileListEvent &) const {
    return MessageType::FileList;
  }
  MessageType operator()(const TextRejectedEvent &) const {
    return MessageType::TextRejected;
  }
  MessageType operator()(const ErrorEvent &) const {
    return MessageType::ErrorNotice;
  }
  MessageType operator()(const PongEvent &) const { return MessageType::Pong; }
};

std::string dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

MessageType event_type(const Event &event) {
  return std::visit(EventTyper{}, event);
}

std::string encode_event(const Event &event) {
  json j = std::visit(EventEncoder{}, event);
  j["type"] = message_type_name(event_type(event));
  return dump(j);
}

std::string encode_file_list(const std::vector<FileMeta> &files) {
  json j = json::array();
  for (const auto &file : files) {
    j.push_back(file_json(file));
  }
  return dump(j);
}

} // namespace syncboard
