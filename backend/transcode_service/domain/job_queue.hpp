#pragma once

#include <expected>
#include <functional>
#include <string>

namespace transcode_service {

inline constexpr const char* kQueueNotInitialized = "queue transport not initialized";

struct Delivery {
  std::string message_id;
  std::string body;
};

struct DeliveryOutcome {
  enum class Kind { Ack, Reject };

  Kind kind{Kind::Ack};
  bool requeue{false};

  static DeliveryOutcome ack() { return {Kind::Ack, false}; }
  static DeliveryOutcome reject(bool requeue) { return {Kind::Reject, requeue}; }
};

// Invoked once per delivery; the next delivery for the same consumer slot is
// not fetched until the returned outcome has been settled with the broker.
using DeliveryHandler = std::function<DeliveryOutcome(const Delivery&)>;

// Durable work queue. Every operation fails with kQueueNotInitialized until
// connect() has succeeded.
class JobQueue {
public:
  virtual ~JobQueue() = default;

  virtual std::expected<void, std::string> connect() = 0;
  virtual bool connected() const = 0;

  virtual std::expected<void, std::string> assertQueue(const std::string& queue, bool durable) = 0;

  virtual std::expected<void, std::string> publish(
    const std::string& queue,
    const std::string& payload,
    bool persistent
  ) = 0;

  // Registers the handler and returns; deliveries arrive on transport-owned threads.
  // At most `prefetch` deliveries are unacknowledged at any time.
  virtual std::expected<void, std::string> consume(
    const std::string& queue,
    unsigned int prefetch,
    DeliveryHandler handler
  ) = 0;

  // Ready (not yet delivered) messages
  virtual std::expected<long, std::string> depth(const std::string& queue) = 0;

  // Ends consumption; a delivery being handled is settled first
  virtual void stop() = 0;
};

} // namespace transcode_service
