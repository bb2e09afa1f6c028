#pragma once

#include "gentrade/broker/transport.h"

#include <cstdint>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/vector.h>

namespace gentrade::broker {

/**
 * @brief In-process broker with fault injection
 *
 * Messages stay unacked after receive() until ack() or requeue_unacked(),
 * which puts them back at the head of their queue flagged as redelivered,
 * the way a broker does when a consumer dies. Thread-safe.
 */
class MemoryQueue final : public BrokerConnector {
public:
  MemoryQueue() = default;
  ~MemoryQueue() noexcept override = default;

  kj::Own<BrokerConnection> connect() override;
  kj::Own<BrokerConsumer> open_consumer(kj::StringPtr queue) override;

  // connect() throws DISCONNECTED while set
  void refuse_connections(bool refuse);

  // The next `count` publishes fail with DISCONNECTED and kill their connection
  void break_next_publishes(int count);

  // Every connection opened so far reports closed
  void drop_connections();

  // Back to the queue head, flagged as redelivered
  size_t requeue_unacked();

  // Publish directly, bypassing connections
  void inject(kj::StringPtr queue, kj::StringPtr payload);

  [[nodiscard]] size_t pending(kj::StringPtr queue) const;
  [[nodiscard]] size_t unacked() const;
  [[nodiscard]] std::uint64_t published() const;
  [[nodiscard]] std::uint64_t acked() const;
  [[nodiscard]] std::uint64_t connects() const;
  [[nodiscard]] kj::Array<kj::String> payloads(kj::StringPtr queue) const;

private:
  class Connection;
  class Consumer;

  struct Message {
    std::uint64_t id{0};
    kj::String queue;
    kj::String payload;
    int deliveries{0};
  };

  struct State {
    kj::TreeMap<kj::String, kj::Vector<Message>> ready;
    kj::TreeMap<std::uint64_t, Message> in_flight;
    std::uint64_t next_id{1};
    std::uint64_t generation{0};
    std::uint64_t published{0};
    std::uint64_t acked{0};
    std::uint64_t connects{0};
    int broken_publishes{0};
    bool refuse{false};
  };

  static void enqueue(State& state, Message message, bool at_front);

  kj::MutexGuarded<State> state_;
};

} // namespace gentrade::broker
