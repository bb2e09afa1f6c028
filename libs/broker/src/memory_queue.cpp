#include "gentrade/broker/memory_queue.h"

#include <kj/debug.h>

namespace gentrade::broker {

class MemoryQueue::Connection final : public BrokerConnection {
public:
  Connection(MemoryQueue& broker, std::uint64_t generation)
      : broker_(broker), generation_(generation) {}

  DeliveryReceipt publish(kj::StringPtr queue, kj::StringPtr payload) override {
    auto lock = broker_.state_.lockExclusive();
    if (broken_ || lock->generation != generation_) {
      kj::throwFatalException(
          KJ_EXCEPTION(DISCONNECTED, "memory broker connection is closed"));
    }
    if (lock->broken_publishes > 0) {
      --lock->broken_publishes;
      broken_ = true;
      kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "memory broker connection reset"));
    }
    Message message;
    message.id = lock->next_id++;
    message.queue = kj::str(queue);
    message.payload = kj::str(payload);
    auto id = message.id;
    enqueue(*lock, kj::mv(message), false);
    ++lock->published;
    return DeliveryReceipt{kj::str(id)};
  }

  bool is_open() const override {
    return !broken_ && broker_.state_.lockShared()->generation == generation_;
  }

private:
  MemoryQueue& broker_;
  std::uint64_t generation_;
  bool broken_{false};
};

class MemoryQueue::Consumer final : public BrokerConsumer {
public:
  Consumer(MemoryQueue& broker, kj::StringPtr queue) : broker_(broker), queue_(kj::str(queue)) {}

  kj::Maybe<Delivery> receive(kj::Duration timeout) override {
    return broker_.state_.when(
        [&](const State& s) {
          KJ_IF_SOME(messages, s.ready.find(queue_)) {
            return messages.size() > 0;
          }
          return false;
        },
        [&](State& s) -> kj::Maybe<Delivery> {
          KJ_IF_SOME(messages, s.ready.find(queue_)) {
            if (messages.size() == 0) {
              return kj::none;
            }
            Message message = kj::mv(messages.front());
            // shift the rest down; queues in tests are short
            for (size_t i = 1; i < messages.size(); ++i) {
              messages[i - 1] = kj::mv(messages[i]);
            }
            messages.removeLast();

            ++message.deliveries;
            Delivery delivery;
            delivery.tag = kj::str(message.id);
            delivery.payload = kj::str(message.payload);
            delivery.redelivered = message.deliveries > 1;
            auto id = message.id;
            s.in_flight.insert(id, kj::mv(message));
            return kj::mv(delivery);
          }
          return kj::none;
        },
        timeout);
  }

  void ack(const Delivery& delivery) override {
    auto id = delivery.tag.parseAs<std::uint64_t>();
    auto lock = broker_.state_.lockExclusive();
    if (lock->in_flight.erase(id)) {
      ++lock->acked;
    }
  }

private:
  MemoryQueue& broker_;
  kj::String queue_;
};

void MemoryQueue::enqueue(State& state, Message message, bool at_front) {
  using Entry = kj::TreeMap<kj::String, kj::Vector<Message>>::Entry;
  auto& messages = state.ready.findOrCreate(
      message.queue, [&]() { return Entry{kj::str(message.queue), kj::Vector<Message>()}; });
  if (!at_front) {
    messages.add(kj::mv(message));
    return;
  }
  messages.add(Message());
  for (size_t i = messages.size() - 1; i > 0; --i) {
    messages[i] = kj::mv(messages[i - 1]);
  }
  messages[0] = kj::mv(message);
}

kj::Own<BrokerConnection> MemoryQueue::connect() {
  auto lock = state_.lockExclusive();
  if (lock->refuse) {
    kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "memory broker refused the connection"));
  }
  ++lock->connects;
  return kj::heap<Connection>(*this, lock->generation);
}

kj::Own<BrokerConsumer> MemoryQueue::open_consumer(kj::StringPtr queue) {
  return kj::heap<Consumer>(*this, queue);
}

void MemoryQueue::refuse_connections(bool refuse) {
  state_.lockExclusive()->refuse = refuse;
}

void MemoryQueue::break_next_publishes(int count) {
  state_.lockExclusive()->broken_publishes = count;
}

void MemoryQueue::drop_connections() {
  ++state_.lockExclusive()->generation;
}

size_t MemoryQueue::requeue_unacked() {
  auto lock = state_.lockExclusive();
  kj::Vector<Message> returning;
  for (auto& entry : lock->in_flight) {
    returning.add(kj::mv(entry.value));
  }
  lock->in_flight.clear();
  // newest first so the oldest ends up at the head
  for (size_t i = returning.size(); i > 0; --i) {
    enqueue(*lock, kj::mv(returning[i - 1]), true);
  }
  return returning.size();
}

void MemoryQueue::inject(kj::StringPtr queue, kj::StringPtr payload) {
  auto lock = state_.lockExclusive();
  Message message;
  message.id = lock->next_id++;
  message.queue = kj::str(queue);
  message.payload = kj::str(payload);
  enqueue(*lock, kj::mv(message), false);
  ++lock->published;
}

size_t MemoryQueue::pending(kj::StringPtr queue) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(messages, lock->ready.find(queue)) {
    return messages.size();
  }
  return 0;
}

size_t MemoryQueue::unacked() const {
  return state_.lockShared()->in_flight.size();
}

std::uint64_t MemoryQueue::published() const {
  return state_.lockShared()->published;
}

std::uint64_t MemoryQueue::acked() const {
  return state_.lockShared()->acked;
}

std::uint64_t MemoryQueue::connects() const {
  return state_.lockShared()->connects;
}

kj::Array<kj::String> MemoryQueue::payloads(kj::StringPtr queue) const {
  auto lock = state_.lockShared();
  KJ_IF_SOME(messages, lock->ready.find(queue)) {
    return KJ_MAP(message, messages) { return kj::str(message.payload); };
  }
  return nullptr;
}

} // namespace gentrade::broker
