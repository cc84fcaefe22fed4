/**
 * @file file_store.cpp
 * @brief In-memory file store implementation
 */

#include "syncboard/file_store.h"
#include "syncboard/security.h"
#include <algorithm>
#include <map>
#include <mutex>

namespace syncboard {

// ============================================================================
// Filename Sanitizing
// ============================================================================

std::string sanitize_filename(const std::string &name) {
  auto slash = name.find_last_of("/\\");
  std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f || c == '"') {
      continue;
    }
    out.push_back(c);
  }

  if (out.size() > MAX_FILENAME_LENGTH) {
    out.resize(MAX_FILENAME_LENGTH);
  }

  if (out.empty() || out == "." || out == "..") {
    return DEFAULT_FILENAME;
  }
  return out;
}

// ============================================================================
// FileStore Implementation
// ============================================================================

class FileStore::Impl {
public:
  struct Record {
    FileEntry entry;
    uint64_t sequence = 0;
  };

  FileStoreConfig config;
  mutable std::mutex mutex;
  std::map<FileId, Record> entries;
  uint64_t total_bytes = 0;
  uint64_t next_sequence = 0;

  // Caller holds the mutex
  void erase(std::map<FileId, Record>::iterator it) {
    total_bytes -= it->second.entry.meta.size_bytes;
    entries.erase(it);
  }

  // Caller holds the mutex
  std::vector<FileId> take_where(MonoTime now, bool all) {
    std::vector<std::pair<uint64_t, FileId>> removed;
    for (auto it = entries.begin(); it != entries.end();) {
      if (all || it->second.entry.is_expired(now)) {
        removed.emplace_back(it->second.sequence, it->first);
        auto next = std::next(it);
        erase(it);
        it = next;
      } else {
        ++it;
      }
    }

    std::sort(removed.begin(), removed.end());
    std::vector<FileId> ids;
    ids.reserve(removed.size());
    for (auto &r : removed) {
      ids.push_back(std::move(r.second));
    }
    return ids;
  }
};

FileStore::FileStore(const FileStoreConfig &config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;
}

FileStore::~FileStore() = default;

Result<FileMeta> FileStore::put(const std::string &filename,
                                const std::string &mime_type, Bytes data,
                                const ClientId &uploaded_by) {
  return put(filename, mime_type, std::move(data), uploaded_by,
             MonoClock::now());
}

Result<FileMeta> FileStore::put(const std::string &filename,
                                const std::string &mime_type, Bytes data,
                                const ClientId &uploaded_by, MonoTime now) {
  auto pending = prepare(filename, mime_type, std::move(data), uploaded_by);
  if (pending.is_error()) {
    return pending.error();
  }
  return commit(std::move(pending.value()), now);
}

Result<PendingFile> FileStore::prepare(const std::string &filename,
                                       const std::string &mime_type,
                                       Bytes data,
                                       const ClientId &uploaded_by) const {
  const uint64_t size = data.size();
  if (size > impl_->config.max_file_size_bytes) {
    return Error(ErrorCode::PayloadTooLarge, "File too large",
                 std::to_string(size) + " > " +
                     std::to_string(impl_->config.max_file_size_bytes) +
                     " bytes");
  }

  auto digest = digest_hex(data);
  if (digest.is_error()) {
    return digest.error();
  }

  PendingFile pending;
  pending.meta.filename = sanitize_filename(filename);
  pending.meta.mime_type = mime_type.empty() ? DEFAULT_MIME_TYPE : mime_type;
  pending.meta.size_bytes = size;
  pending.meta.uploaded_by = uploaded_by;
  pending.meta.digest = std::move(digest.value());
  pending.data = std::make_shared<const Bytes>(std::move(data));
  return pending;
}

Result<FileMeta> FileStore::commit(PendingFile pending) {
  return commit(std::move(pending), MonoClock::now());
}

Result<FileMeta> FileStore::commit(PendingFile pending, MonoTime now) {
  FileMeta meta = std::move(pending.meta);
  const uint64_t size = meta.size_bytes;
  if (!pending.data || pending.data->size() != size) {
    return Error(ErrorCode::InvalidArgument, "Pending file has no data");
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->total_bytes + size > impl_->config.max_total_bytes) {
    return Error(ErrorCode::StorageFull, "File storage is full",
                 std::to_string(impl_->total_bytes) + " of " +
                     std::to_string(impl_->config.max_total_bytes) +
                     " bytes in use");
  }

  // 128-bit random ids; the loop only guards the invariant
  do {
    auto token = generate_token();
    if (token.is_error()) {
      return token.error();
    }
    meta.id = std::move(token.value());
  } while (impl_->entries.count(meta.id) != 0);

  meta.uploaded_at = WallClock::now();
  meta.expires_at = now + impl_->config.ttl;

  Impl::Record record;
  record.entry.meta = meta;
  record.entry.data = std::move(pending.data);
  record.sequence = impl_->next_sequence++;

  impl_->entries.emplace(meta.id, std::move(record));
  impl_->total_bytes += size;
  return meta;
}

bool FileStore::remove(const FileId &id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->entries.find(id);
  if (it == impl_->entries.end()) {
    return false;
  }
  impl_->erase(it);
  return true;
}

std::vector<FileId> FileStore::sweep(MonoTime now) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->take_where(now, false);
}

std::vector<FileId> FileStore::clear() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->take_where(MonoTime{}, true);
}

Result<FileEntry> FileStore::get(const FileId &id) const {
  return get(id, MonoClock::now());
}

Result<FileEntry> FileStore::get(const FileId &id, MonoTime now) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->entries.find(id);
  if (it == impl_->entries.end()) {
    return Error(ErrorCode::NotFound, "File not found", id);
  }
  if (it->second.entry.is_expired(now)) {
    return Error(ErrorCode::Expired, "File has expired", id);
  }
  return it->second.entry;
}

std::vector<FileMeta> FileStore::list() const { return list(MonoClock::now()); }

std::vector<FileMeta> FileStore::list(MonoTime now) const {
  std::vector<std::pair<uint64_t, FileMeta>> live;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    live.reserve(impl_->entries.size());
    for (const auto &kv : impl_->entries) {
      if (!kv.second.entry.is_expired(now)) {
        live.emplace_back(kv.second.sequence, kv.second.entry.meta);
      }
    }
  }

  std::sort(live.begin(), live.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  std::vector<FileMeta> out;
  out.reserve(live.size());
  for (auto &l : live) {
    out.push_back(std::move(l.second));
  }
  return out;
}

size_t FileStore::count() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->entries.size();
}

uint64_t FileStore::total_bytes() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->total_bytes;
}

const FileStoreConfig &FileStore::config() const { return impl_->config; }

} // namespace syncboard
