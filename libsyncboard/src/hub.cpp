/**
 * @file hub.cpp
 * @brief BroadcastHub implementation
 */

#include "syncboard/hub.h"
#include "syncboard/syncboard.h"
#include <mutex>
#include <spdlog/spdlog.h>

namespace syncboard {

// ============================================================================
// BroadcastHub Implementation
// ============================================================================

class BroadcastHub::Impl {
public:
  Impl(Board &b, Transport &t) : board(b), transport(t) {}

  Board &board;
  Transport &transport;

  // Held across "mutate + enqueue fan-out"; never across blocking I/O
  std::mutex mutex;

  // Caller holds the mutex. Failed sends are collected, not handled here.
  void broadcast_locked(const Event &event, std::vector<ClientId> &failed) {
    auto clients = board.clients().list();
    spdlog::debug("Broadcast {} to {} clients",
                  message_type_name(event_type(event)), clients.size());
    for (const auto &id : clients) {
      auto sent = transport.send_to(id, event);
      if (sent.is_error()) {
        spdlog::warn("Send to {} failed: {}", id, sent.error().to_string());
        failed.push_back(id);
      }
    }
  }

  // Caller holds the mutex. Unregistered ids are skipped.
  void unicast_locked(const ClientId &id, const Event &event,
                      std::vector<ClientId> &failed) {
    if (!board.clients().contains(id)) {
      return;
    }
    auto sent = transport.send_to(id, event);
    if (sent.is_error()) {
      spdlog::warn("Send to {} failed: {}", id, sent.error().to_string());
      failed.push_back(id);
    }
  }

  void reply_error_locked(const ClientId &id, const Error &error,
                          std::vector<ClientId> &failed) {
    unicast_locked(id, ErrorEvent{error.code, error.message}, failed);
  }

  void broadcast_presence_locked(std::vector<ClientId> &failed) {
    broadcast_locked(PresenceChangedEvent{board.clients().count()}, failed);
  }

  /**
   * Close and unregister every client in `dropped`. Each removal broadcasts
   * presence, which can itself fail for further clients; those are handled
   * in the same loop.
   */
  void drop_clients(std::vector<ClientId> dropped, const char *reason) {
    while (!dropped.empty()) {
      ClientId id = std::move(dropped.back());
      dropped.pop_back();

      transport.close(id, reason);

      std::lock_guard<std::mutex> lock(mutex);
      if (board.clients().unregister_client(id)) {
        spdlog::info("Client {} dropped ({}), {} connected", id, reason,
                     board.clients().count());
        broadcast_presence_locked(dropped);
      }
    }
  }
};

BroadcastHub::BroadcastHub(Board &board, Transport &transport)
    : impl_(std::make_unique<Impl>(board, transport)) {}

BroadcastHub::~BroadcastHub() = default;

Board &BroadcastHub::board() { return impl_->board; }
const Board &BroadcastHub::board() const { return impl_->board; }

// ============================================================================
// Connection Lifecycle
// ============================================================================

Result<void> BroadcastHub::on_client_connected(
    const ClientId &id, const std::string &remote_address) {
  std::vector<ClientId> failed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto registered = impl_->board.clients().register_client(id, remote_address);
    if (registered.is_error()) {
      spdlog::warn("Rejected connection {}: {}", id,
                   registered.error().to_string());
      return registered.error();
    }

    spdlog::info("Client {} connected from {}, {} connected", id,
                 remote_address.empty() ? "?" : remote_address,
                 impl_->board.clients().count());

    impl_->unicast_locked(id, WelcomeEvent{id, VERSION_STRING}, failed);
    impl_->unicast_locked(
        id, TextUpdatedEvent{impl_->board.clipboard().current()}, failed);
    impl_->unicast_locked(id, FileListEvent{impl_->board.files().list()},
                          failed);
    impl_->broadcast_presence_locked(failed);
  }

  impl_->drop_clients(std::move(failed), "send failed");
  return Result<void>::ok();
}

void BroadcastHub::on_client_disconnected(const ClientId &id) {
  std::vector<ClientId> failed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->board.clients().unregister_client(id)) {
      return;
    }
    spdlog::info("Client {} disconnected, {} connected", id,
                 impl_->board.clients().count());
    impl_->broadcast_presence_locked(failed);
  }
  impl_->drop_clients(std::move(failed), "send failed");
}

void BroadcastHub::on_client_heartbeat(const ClientId &id) {
  on_client_heartbeat(id, MonoClock::now());
}

void BroadcastHub::on_client_heartbeat(const ClientId &id, MonoTime now) {
  // Late pongs from connections already dropped are expected
  auto touched = impl_->board.clients().touch(id, now);
  SYNCBOARD_UNUSED(touched);
}

void BroadcastHub::on_message(const ClientId &id, const std::string &frame) {
  if (impl_->board.clients().touch(id).is_error()) {
    spdlog::debug("Dropping message from unregistered client {}", id);
    return;
  }

  auto intent = decode_intent(frame);
  if (intent.is_error()) {
    spdlog::debug("Bad message from {}: {}", id, intent.error().to_string());
    std::vector<ClientId> failed;
    {
      std::lock_guard<std::mutex> lock(impl_->mutex);
      impl_->reply_error_locked(id, intent.error(), failed);
    }
    impl_->drop_clients(std::move(failed), "send failed");
    return;
  }

  auto &value = intent.value();
  if (auto *text = std::get_if<TextIntent>(&value)) {
    // Outcome is already reported to the client by on_text_submit
    auto submitted = on_text_submit(id, text->content, text->version);
    SYNCBOARD_UNUSED(submitted);
  } else if (std::holds_alternative<FileMetaRequestIntent>(value)) {
    on_file_list_request(id);
  } else if (auto *del = std::get_if<FileDeleteIntent>(&value)) {
    auto deleted = on_file_delete(id, del->id);
    SYNCBOARD_UNUSED(deleted);
  } else if (std::holds_alternative<ClearIntent>(value)) {
    on_clear(id);
  } else if (std::holds_alternative<PingIntent>(value)) {
    std::vector<ClientId> failed;
    {
      std::lock_guard<std::mutex> lock(impl_->mutex);
      impl_->unicast_locked(id, PongEvent{}, failed);
    }
    impl_->drop_clients(std::move(failed), "send failed");
  }
}

// ============================================================================
// Intents
// ============================================================================

Result<ClipboardText> BroadcastHub::on_text_submit(const ClientId &id,
                                                   const std::string &content,
                                                   uint64_t expected_version) {
  std::vector<ClientId> failed;
  Result<ClipboardText> result = Error(ErrorCode::Unknown);
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    ClipboardText current;
    result = impl_->board.clipboard().update(content, expected_version, id,
                                             &current);
    if (result.is_ok()) {
      spdlog::debug("Text v{} from {} ({} bytes)", result.value().version, id,
                    content.size());
      impl_->broadcast_locked(TextUpdatedEvent{result.value()}, failed);
    } else if (result.error().code == ErrorCode::StaleVersion) {
      spdlog::warn("Stale text from {}: based on v{}, current v{}", id,
                   expected_version, current.version);
      impl_->unicast_locked(id, TextRejectedEvent{current}, failed);
    } else {
      spdlog::warn("Text from {} rejected: {}", id,
                   result.error().to_string());
      impl_->reply_error_locked(id, result.error(), failed);
    }
  }

  impl_->drop_clients(std::move(failed), "send failed");
  return result;
}

Result<FileMeta> BroadcastHub::on_file_upload(const ClientId &id,
                                              const std::string &filename,
                                              const std::string &mime_type,
                                              Bytes data) {
  auto &files = impl_->board.files();
  const size_t size = data.size();

  // Size check and hashing run before the hub lock; they scale with the file
  Result<FileMeta> result = Error(ErrorCode::Unknown);
  auto pending = files.prepare(filename, mime_type, std::move(data), id);

  std::vector<ClientId> failed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    if (pending.is_error()) {
      result = pending.error();
    } else {
      if (size + files.total_bytes() > files.config().max_total_bytes) {
        auto removed = files.sweep(MonoClock::now());
        for (const auto &file_id : removed) {
          impl_->broadcast_locked(FileRemovedEvent{file_id}, failed);
        }
        if (!removed.empty()) {
          spdlog::info("Evicted {} expired files to make room",
                       removed.size());
        }
      }
      result = files.commit(std::move(pending.value()));
    }

    if (result.is_ok()) {
      const auto &meta = result.value();
      spdlog::info("Stored {} ({}, {}) as {}", meta.filename,
                   format_size(meta.size_bytes), meta.mime_type, meta.id);
      impl_->broadcast_locked(FileAddedEvent{meta}, failed);
    } else {
      spdlog::warn("Upload of '{}' ({}) from {} rejected: {}", filename,
                   format_size(size), id.empty() ? "anonymous" : id,
                   result.error().to_string());
      impl_->reply_error_locked(id, result.error(), failed);
    }
  }

  impl_->drop_clients(std::move(failed), "send failed");
  return result;
}

Result<FileEntry>
BroadcastHub::on_file_download_request(const FileId &file_id) const {
  return impl_->board.files().get(file_id);
}

Result<void> BroadcastHub::on_file_delete(const ClientId &id,
                                          const FileId &file_id) {
  std::vector<ClientId> failed;
  Result<void> result;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->board.files().remove(file_id)) {
      spdlog::info("File {} deleted by {}", file_id,
                   id.empty() ? "anonymous" : id);
      impl_->broadcast_locked(FileRemovedEvent{file_id}, failed);
    } else {
      result = Error(ErrorCode::NotFound, "File not found", file_id);
      impl_->reply_error_locked(id, result.error(), failed);
    }
  }

  impl_->drop_clients(std::move(failed), "send failed");
  return result;
}

void BroadcastHub::on_file_list_request(const ClientId &id) {
  std::vector<ClientId> failed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->unicast_locked(id, FileListEvent{impl_->board.files().list()},
                          failed);
  }
  impl_->drop_clients(std::move(failed), "send failed");
}

void BroadcastHub::on_clear(const ClientId &id) {
  std::vector<ClientId> failed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto text = impl_->board.clipboard().clear(id);
    impl_->broadcast_locked(TextUpdatedEvent{text}, failed);

    auto removed = impl_->board.files().clear();
    for (const auto &file_id : removed) {
      impl_->broadcast_locked(FileRemovedEvent{file_id}, failed);
    }
    spdlog::info("Board cleared by {} ({} files removed)", id, removed.size());
  }
  impl_->drop_clients(std::move(failed), "send failed");
}

// ============================================================================
// Periodic Work
// ============================================================================

std::vector<FileId> BroadcastHub::periodic_sweep() {
  return periodic_sweep(MonoClock::now());
}

std::vector<FileId> BroadcastHub::periodic_sweep(MonoTime now) {
  std::vector<ClientId> failed;
  std::vector<FileId> removed;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    removed = impl_->board.files().sweep(now);
    for (const auto &file_id : removed) {
      impl_->broadcast_locked(FileRemovedEvent{file_id}, failed);
    }
  }

  if (!removed.empty()) {
    spdlog::info("Sweep evicted {} expired files", removed.size());
  }
  impl_->drop_clients(std::move(failed), "send failed");
  return removed;
}

std::vector<ClientId> BroadcastHub::reap_idle_clients() {
  return reap_idle_clients(MonoClock::now());
}

std::vector<ClientId> BroadcastHub::reap_idle_clients(MonoTime now) {
  auto timeout = impl_->board.config().client_timeout;
  if (timeout.count() <= 0) {
    return {};
  }

  auto idle = impl_->board.clients().idle_clients(now, timeout);
  for (const auto &id : idle) {
    spdlog::warn("Client {} silent for {}s, disconnecting", id,
                 timeout.count());
  }
  impl_->drop_clients(idle, "idle timeout");
  return idle;
}

} // namespace syncboard
