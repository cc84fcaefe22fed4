/**
 * @file http.h
 * @brief Response helpers for the upload and download endpoints
 *
 * Pure functions over strings. HttpServer hands requests to cpp-httplib for
 * parsing and uses these to build status codes, headers and JSON bodies.
 */

#ifndef SYNCBOARD_HTTP_H
#define SYNCBOARD_HTTP_H

#include "error.h"
#include "file_store.h"
#include "platform.h"
#include <string>

namespace syncboard {

// ============================================================================
// Responses
// ============================================================================

/**
 * @brief HTTP status for a failed request
 */
SYNCBOARD_API int http_status_for(ErrorCode code);

/**
 * @brief JSON body describing an error: {"error":NAME,"message":TEXT}
 */
SYNCBOARD_API std::string error_body(const Error &error);

/**
 * @brief Content-Disposition value for downloading `filename`
 *
 * Carries an ASCII fallback and an RFC 5987 `filename*` for other names.
 */
SYNCBOARD_API std::string content_disposition(const std::string &filename);

/**
 * @brief Body of a successful upload: {"id","filename","size","mimeType"}
 */
SYNCBOARD_API std::string upload_body(const FileMeta &meta);

/**
 * @brief Body of the health endpoint
 */
SYNCBOARD_API std::string health_body(size_t clients, size_t files);

/**
 * @brief Quoted entity tag for a stored file
 */
SYNCBOARD_API std::string entity_tag(const FileMeta &meta);

} // namespace syncboard

#endif // SYNCBOARD_HTTP_H
