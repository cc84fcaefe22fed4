/**
 * @file connection_registry.h
 * @brief Live client connections and their liveness
 */

#ifndef SYNCBOARD_CONNECTION_REGISTRY_H
#define SYNCBOARD_CONNECTION_REGISTRY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace syncboard {

// ============================================================================
// Client
// ============================================================================

/**
 * @brief A connected client as seen by the board
 */
struct Client {
  ClientId id;

  /// Peer address reported by the transport (informational)
  std::string remote_address;

  WallTime connected_at;

  /// Last heartbeat or message (monotonic)
  MonoTime last_seen_at;
};

// ============================================================================
// Connection Registry
// ============================================================================

/**
 * @brief Set of currently connected clients
 *
 * Thread-safe. Every mutation is visible to the next list() call from any
 * thread.
 */
class SYNCBOARD_API ConnectionRegistry {
public:
  ConnectionRegistry();
  ~ConnectionRegistry();

  // Non-copyable
  ConnectionRegistry(const ConnectionRegistry &) = delete;
  ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

  /**
   * @brief Add a client
   * @return The stored client, or DuplicateClient if the id is taken
   */
  Result<Client> register_client(const ClientId &id,
                                 const std::string &remote_address = {});

  /**
   * @brief Remove a client
   * @return true if it was present; removing an absent id is a no-op
   */
  bool unregister_client(const ClientId &id);

  /**
   * @brief Snapshot of connected ids
   */
  std::set<ClientId> list() const;

  /**
   * @brief Record activity from a client
   * @return ClientNotFound if the id is not registered
   */
  Result<void> touch(const ClientId &id);
  Result<void> touch(const ClientId &id, MonoTime now);

  /// Look up one client
  Result<Client> get(const ClientId &id) const;

  bool contains(const ClientId &id) const;

  size_t count() const;

  /**
   * @brief Clients whose last activity is at least `timeout` before `now`
   */
  std::vector<ClientId> idle_clients(MonoTime now,
                                     std::chrono::seconds timeout) const;

  /// Drop every client (shutdown)
  void clear();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace syncboard

#endif // SYNCBOARD_CONNECTION_REGISTRY_H
