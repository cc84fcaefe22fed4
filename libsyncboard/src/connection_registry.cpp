/**
 * @file connection_registry.cpp
 * @brief Connection registry implementation
 */

#include "syncboard/connection_registry.h"
#include <map>
#include <mutex>

namespace syncboard {

class ConnectionRegistry::Impl {
public:
  mutable std::mutex mutex;
  std::map<ClientId, Client> clients;
};

ConnectionRegistry::ConnectionRegistry() : impl_(std::make_unique<Impl>()) {}
ConnectionRegistry::~ConnectionRegistry() = default;

Result<Client> ConnectionRegistry::register_client(
    const ClientId &id, const std::string &remote_address) {
  SYNCBOARD_REQUIRE(!id.empty(), ErrorCode::InvalidArgument,
                    "Client id must not be empty");

  Client client;
  client.id = id;
  client.remote_address = remote_address;
  client.connected_at = WallClock::now();
  client.last_seen_at = MonoClock::now();

  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto inserted = impl_->clients.emplace(id, client);
  if (!inserted.second) {
    return Error(ErrorCode::DuplicateClient, "Client already registered", id);
  }
  return client;
}

bool ConnectionRegistry::unregister_client(const ClientId &id) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->clients.erase(id) > 0;
}

std::set<ClientId> ConnectionRegistry::list() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  std::set<ClientId> ids;
  for (const auto &kv : impl_->clients) {
    ids.insert(ids.end(), kv.first);
  }
  return ids;
}

Result<void> ConnectionRegistry::touch(const ClientId &id) {
  return touch(id, MonoClock::now());
}

Result<void> ConnectionRegistry::touch(const ClientId &id, MonoTime now) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->clients.find(id);
  if (it == impl_->clients.end()) {
    return Error(ErrorCode::ClientNotFound, "Client not registered", id);
  }
  it->second.last_seen_at = now;
  return Result<void>::ok();
}

Result<Client> ConnectionRegistry::get(const ClientId &id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  auto it = impl_->clients.find(id);
  if (it == impl_->clients.end()) {
    return Error(ErrorCode::ClientNotFound, "Client not registered", id);
  }
  return it->second;
}

bool ConnectionRegistry::contains(const ClientId &id) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->clients.count(id) != 0;
}

size_t ConnectionRegistry::count() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->clients.size();
}

std::vector<ClientId>
ConnectionRegistry::idle_clients(MonoTime now,
                                 std::chrono::seconds timeout) const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  std::vector<ClientId> idle;
  for (const auto &kv : impl_->clients) {
    if (kv.second.last_seen_at + timeout <= now) {
      idle.push_back(kv.first);
    }
  }
  return idle;
}

void ConnectionRegistry::clear() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->clients.clear();
}

} // namespace syncboard
