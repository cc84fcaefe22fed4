/**
 * @file file_store.h
 * @brief In-memory file store with time-based expiry
 *
 * Files live only in memory. Each entry expires a fixed TTL after upload;
 * expiry is decided by timestamp on every read, and a periodic sweep
 * reclaims the memory. Both use the same rule: an entry is expired once
 * `now >= expires_at`.
 */

#ifndef SYNCBOARD_FILE_STORE_H
#define SYNCBOARD_FILE_STORE_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace syncboard {

/// MIME type used when the uploader does not name one
constexpr const char *DEFAULT_MIME_TYPE = "application/octet-stream";

/// Name given to uploads without a usable filename
constexpr const char *DEFAULT_FILENAME = "unnamed";

/// Longest stored filename
constexpr size_t MAX_FILENAME_LENGTH = 255;

// ============================================================================
// File Metadata
// ============================================================================

/**
 * @brief Everything about a stored file except its bytes
 */
struct FileMeta {
  FileId id;
  std::string filename;
  std::string mime_type;
  uint64_t size_bytes = 0;

  /// Wall-clock upload time (reported to clients)
  WallTime uploaded_at;

  /// Monotonic deadline; unreachable from this instant on
  MonoTime expires_at;

  /// Uploading client (may be empty for anonymous HTTP uploads)
  ClientId uploaded_by;

  /// Hex BLAKE2b-256 of the data
  std::string digest;
};

/**
 * @brief A stored file with its data
 *
 * The data buffer is shared and immutable, so a reader keeps a consistent
 * view even if the entry is removed while it is being sent.
 */
struct FileEntry {
  FileMeta meta;
  SharedBytes data;

  /// True once the entry's deadline has passed
  bool is_expired(MonoTime now) const { return now >= meta.expires_at; }
};

/**
 * @brief An upload that has been checked and hashed but not yet stored
 *
 * Produced by FileStore::prepare() without taking the store's lock and
 * turned into an entry by FileStore::commit().
 */
struct PendingFile {
  /// Filename, MIME type, size, uploader and digest are final; id and
  /// timestamps are assigned on commit
  FileMeta meta;
  SharedBytes data;
};

// ============================================================================
// Configuration
// ============================================================================

struct FileStoreConfig {
  /// Time-to-live of every entry
  std::chrono::seconds ttl{3600};

  /// Largest accepted single file
  uint64_t max_file_size_bytes = 100ull * 1024 * 1024;

  /// Cap on the sum of stored file sizes
  uint64_t max_total_bytes = 512ull * 1024 * 1024;
};

/**
 * @brief Reduce an uploaded name to a safe display filename
 *
 * Drops directory components and control characters, truncates to
 * MAX_FILENAME_LENGTH bytes, and falls back to DEFAULT_FILENAME.
 */
SYNCBOARD_API std::string sanitize_filename(const std::string &name);

// ============================================================================
// File Store
// ============================================================================

/**
 * @brief Thread-safe in-memory catalogue of uploaded files
 *
 * Entries are append-only: they are created by put() and destroyed by
 * remove(), sweep() or clear(), never modified. A single mutex guards the
 * whole map, so sweep() cannot remove an entry in the middle of get().
 *
 * Every time-dependent method has an overload taking `now` explicitly.
 */
class SYNCBOARD_API FileStore {
public:
  explicit FileStore(const FileStoreConfig &config);
  ~FileStore();

  // Non-copyable
  FileStore(const FileStore &) = delete;
  FileStore &operator=(const FileStore &) = delete;

  // ========================================================================
  // Mutation
  // ========================================================================

  /**
   * @brief Store a new file
   *
   * Same as prepare() followed by commit().
   *
   * @return Metadata of the stored entry, or PayloadTooLarge if the file
   *         exceeds the per-file limit, or StorageFull if it would push the
   *         aggregate size over the cap
   */
  Result<FileMeta> put(const std::string &filename,
                       const std::string &mime_type, Bytes data,
                       const ClientId &uploaded_by = {});

  Result<FileMeta> put(const std::string &filename,
                       const std::string &mime_type, Bytes data,
                       const ClientId &uploaded_by, MonoTime now);

  /**
   * @brief Validate, sanitize and hash an upload without touching the store
   *
   * Hashing is proportional to the file size; callers that serialize
   * uploads with other work should run this outside their own locks.
   *
   * @return PayloadTooLarge if the file exceeds the per-file limit
   */
  Result<PendingFile> prepare(const std::string &filename,
                              const std::string &mime_type, Bytes data,
                              const ClientId &uploaded_by = {}) const;

  /**
   * @brief Insert a prepared upload
   *
   * Assigns the id and the expiry deadline (`now + ttl`).
   *
   * @return StorageFull if it would push the aggregate size over the cap
   */
  Result<FileMeta> commit(PendingFile pending);
  Result<FileMeta> commit(PendingFile pending, MonoTime now);

  /**
   * @brief Delete an entry
   * @return true if something was removed (false is not an error)
   */
  bool remove(const FileId &id);

  /**
   * @brief Remove every entry with `expires_at <= now`
   * @return Ids of the removed entries, in upload order
   */
  std::vector<FileId> sweep(MonoTime now);

  /**
   * @brief Remove every entry
   * @return Ids of the removed entries, in upload order
   */
  std::vector<FileId> clear();

  // ========================================================================
  // Queries
  // ========================================================================

  /**
   * @brief Fetch an entry with its data
   * @return NotFound if absent, Expired if present but past its deadline
   *         (whether or not a sweep has run)
   */
  Result<FileEntry> get(const FileId &id) const;
  Result<FileEntry> get(const FileId &id, MonoTime now) const;

  /**
   * @brief Metadata of all unexpired entries, in upload order
   */
  std::vector<FileMeta> list() const;
  std::vector<FileMeta> list(MonoTime now) const;

  /// Number of entries held, including expired ones not yet swept
  size_t count() const;

  /// Sum of sizes of entries held
  uint64_t total_bytes() const;

  const FileStoreConfig &config() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_FILE_STORE_H
