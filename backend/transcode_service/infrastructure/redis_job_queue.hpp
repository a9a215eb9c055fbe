#pragma once
#include <atomic>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "common/config/config.hpp"
#include "common/connection_pool/redis_connection_pool.hpp"
#include "domain/job_queue.hpp"

namespace transcode_service {

// Work queue on Redis lists.
//   <queue>                         ready messages, LPUSH in / pop from the right
//   <queue>:processing:<tag>:<slot> unacknowledged delivery of one consumer slot
//   <queue>:processing:...:owner    claim on that list, expires unless renewed
//   <queue>:meta                    declared queue properties
// A delivery is moved atomically into its slot's processing list and only
// removed from there when the handler's outcome is settled. A slot is served by
// one live process at a time; another process using the same consumer tag waits
// for the claim to lapse instead of recovering deliveries still in flight.
class RedisJobQueue final : public JobQueue {
public:
  RedisJobQueue(config::RedisConfig redis, config::ConnectionPoolConfig pool, std::string consumer_tag);
  ~RedisJobQueue() override;

  RedisJobQueue(const RedisJobQueue&) = delete;
  RedisJobQueue& operator=(const RedisJobQueue&) = delete;

  std::expected<void, std::string> connect() override;
  bool connected() const override { return connected_.load(std::memory_order_acquire); }

  std::expected<void, std::string> assertQueue(const std::string& queue, bool durable) override;
  std::expected<void, std::string> publish(const std::string& queue, const std::string& payload, bool persistent) override;
  std::expected<void, std::string> consume(const std::string& queue, unsigned int prefetch, DeliveryHandler handler) override;
  std::expected<long, std::string> depth(const std::string& queue) override;
  void stop() override;

  size_t activeConnections() const;

  static std::string processingKey(const std::string& queue, const std::string& tag, unsigned int slot);
  static std::string ownerKey(const std::string& processing);

  static constexpr std::chrono::milliseconds kSlotLease{30000};

private:
  void slotLoop(std::stop_token stop, std::string queue, std::string processing, DeliveryHandler handler);
  std::expected<bool, std::string> claimSlot(common::RedisConnection& conn, const std::string& processing);
  // Renews the claim until stopped; runs beside the slot, which is blocked on its own connection
  void holdSlot(std::stop_token stop, const std::string& processing);
  void releaseSlot(common::RedisConnection& conn, const std::string& processing);
  // Returns deliveries a previous run left unacknowledged to the front of the queue
  std::expected<size_t, std::string> recoverUnacked(common::RedisConnection& conn,
                                                    const std::string& queue,
                                                    const std::string& processing);
  std::expected<void, std::string> settle(common::RedisConnection& conn,
                                          const std::string& queue,
                                          const std::string& processing,
                                          const std::string& raw,
                                          const DeliveryOutcome& outcome);

  config::RedisConfig redis_cfg_;
  config::ConnectionPoolConfig pool_cfg_;
  std::string consumer_tag_;
  std::string instance_id_;

  std::mutex init_mutex_;
  std::unique_ptr<common::RedisConnectionPool> pool_;
  std::atomic_bool connected_{false};

  std::mutex consumers_mutex_;
  std::vector<std::jthread> consumers_;
  unsigned int next_slot_{0};
};

} // namespace transcode_service
