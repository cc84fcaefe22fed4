/**
 * @file transport.h
 * @brief What the board core needs from a network transport
 */

#ifndef SYNCBOARD_TRANSPORT_H
#define SYNCBOARD_TRANSPORT_H

#include "error.h"
#include "platform.h"
#include "protocol.h"
#include "types.h"
#include <string>

namespace syncboard {

/**
 * @brief Outbound side of a client transport
 *
 * The inbound side is the BroadcastHub's on_client_connected /
 * on_client_disconnected / on_message, which the transport calls.
 *
 * Implementations must not block in send_to(): it queues the event for the
 * connection and returns. It is called with the hub's lock held and must
 * not call back into the hub.
 */
class SYNCBOARD_API Transport {
public:
  virtual ~Transport() = default;

  /**
   * @brief Queue an event for one client
   * @return TransportFailure if the connection is gone or cannot keep up
   */
  virtual Result<void> send_to(const ClientId &id, const Event &event) = 0;

  /**
   * @brief Close a client's connection
   *
   * Safe to call for unknown or already-closed ids.
   */
  virtual void close(const ClientId &id, const std::string &reason) = 0;
};

} // namespace syncboard

#endif // SYNCBOARD_TRANSPORT_H
