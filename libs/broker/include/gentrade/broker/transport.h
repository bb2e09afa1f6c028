#pragma once

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/time.h>

namespace gentrade::broker {

// Broker's acknowledgement that a published message is durably stored
struct DeliveryReceipt final {
  kj::String message_id;
};

struct Delivery final {
  kj::String tag; // opaque handle used to ack
  kj::String payload;
  bool redelivered{false};
};

/**
 * @brief Publishing side of a broker connection
 *
 * Implementations raise kj::Exception with type DISCONNECTED when the
 * connection is broken; any other type means the broker rejected the message.
 */
class BrokerConnection {
public:
  virtual ~BrokerConnection() = default;

  // Returns only once the broker confirmed the message
  virtual DeliveryReceipt publish(kj::StringPtr queue, kj::StringPtr payload) = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Receiving side of one queue, owned by a single dispatch loop
 */
class BrokerConsumer {
public:
  virtual ~BrokerConsumer() = default;

  // Blocks for at most `timeout`
  virtual kj::Maybe<Delivery> receive(kj::Duration timeout) = 0;
  virtual void ack(const Delivery& delivery) = 0;
};

class BrokerConnector {
public:
  virtual ~BrokerConnector() = default;

  // Throws kj::Exception (DISCONNECTED) when the broker is unreachable
  virtual kj::Own<BrokerConnection> connect() = 0;
  virtual kj::Own<BrokerConsumer> open_consumer(kj::StringPtr queue) = 0;
};

} // namespace gentrade::broker
