/**
 * @file http.cpp
 * @brief HTTP response helpers
 */

#include "syncboard/http.h"
#include <cctype>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace syncboard {

// ============================================================================
// Responses
// ============================================================================

int http_status_for(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return 200;
  case ErrorCode::NotFound:
  case ErrorCode::Expired:
    return 404;
  case ErrorCode::PayloadTooLarge:
    return 413;
  case ErrorCode::StorageFull:
    return 507;
  case ErrorCode::InvalidArgument:
  case ErrorCode::MalformedMessage:
    return 400;
  default:
    return 500;
  }
}

std::string error_body(const Error &error) {
  nlohmann::json j;
  j["error"] = error_code_name(error.code);
  j["message"] = error.message;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string content_disposition(const std::string &filename) {
  std::string ascii;
  std::string encoded;
  bool plain = true;

  for (unsigned char c : filename) {
    if (c < 0x20 || c >= 0x7f || c == '"' || c == '\\') {
      ascii.push_back('_');
      plain = plain && c >= 0x20 && c < 0x7f;
    } else {
      ascii.push_back(static_cast<char>(c));
    }

    if (std::isalnum(c) || std::string("!#$&+-.^_`|~").find(static_cast<char>(
                               c)) != std::string::npos) {
      encoded.push_back(static_cast<char>(c));
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      encoded += buf;
    }
  }

  std::string value = "attachment; filename=\"" + ascii + "\"";
  if (!plain) {
    value += "; filename*=UTF-8''" + encoded;
  }
  return value;
}

std::string upload_body(const FileMeta &meta) {
  nlohmann::json j;
  j["id"] = meta.id;
  j["filename"] = meta.filename;
  j["size"] = meta.size_bytes;
  j["mimeType"] = meta.mime_type;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string health_body(size_t clients, size_t files) {
  nlohmann::json j;
  j["status"] = "ok";
  j["clients"] = clients;
  j["files"] = files;
  return j.dump();
}

std::string entity_tag(const FileMeta &meta) {
  return "\"" + (meta.digest.empty() ? meta.id : meta.digest) + "\"";
}

} // namespace syncboard
