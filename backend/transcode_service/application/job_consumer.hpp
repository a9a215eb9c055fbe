#pragma once

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include "common/config/config.hpp"
#include "domain/job_message.hpp"
#include "domain/job_queue.hpp"

namespace transcode_service {

// Processes one job to completion; an error value rejects the delivery
using JobHandler = std::function<std::expected<void, std::string>(const JobMessage&)>;

class JobConsumer {
public:
  JobConsumer(std::shared_ptr<JobQueue> queue, JobHandler handler, config::QueueConfig cfg);
  // Ends the subscription, deliveries hold a pointer to this consumer
  ~JobConsumer();

  JobConsumer(const JobConsumer&) = delete;
  JobConsumer& operator=(const JobConsumer&) = delete;

  // Subscribes with a prefetch of one
  std::expected<void, std::string> start();
  void stop();

  DeliveryOutcome handleDelivery(const Delivery& delivery);

  std::uint64_t acknowledged() const { return acknowledged_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }

private:
  std::shared_ptr<JobQueue> queue_;
  JobHandler handler_;
  config::QueueConfig cfg_;

  std::atomic<std::uint64_t> acknowledged_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

} // namespace transcode_service
