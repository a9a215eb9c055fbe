#include "job_consumer.hpp"

#include <iostream>

namespace transcode_service {

JobConsumer::JobConsumer(std::shared_ptr<JobQueue> queue, JobHandler handler, config::QueueConfig cfg)
  : queue_(std::move(queue)), handler_(std::move(handler)), cfg_(std::move(cfg)) {}

JobConsumer::~JobConsumer() {
  stop();
}

std::expected<void, std::string> JobConsumer::start() {
  auto res = queue_->consume(cfg_.name, 1, [this](const Delivery& delivery) {
    return handleDelivery(delivery);
  });
  if (!res) {
    return res;
  }
  std::cout << "[Consumer] waiting for jobs on " << cfg_.name << std::endl;
  return {};
}

void JobConsumer::stop() {
  queue_->stop();
}

DeliveryOutcome JobConsumer::handleDelivery(const Delivery& delivery) {
  auto job = deserializeJob(delivery.body);
  if (!job) {
    // no task id to report against
    std::cerr << "[Consumer] rejecting message " << delivery.message_id << ": " << job.error() << std::endl;
    ++rejected_;
    return DeliveryOutcome::reject(false);
  }

  std::cout << "[Consumer] received job for task " << job->queued_task_id << ": " << job->input_path
            << std::endl;

  std::expected<void, std::string> result;
  try {
    result = handler_(*job);
  } catch (const std::exception& e) {
    result = std::unexpected(std::string("job handler threw: ") + e.what());
  }

  if (!result) {
    std::cerr << "[Consumer] job for task " << job->queued_task_id << " failed"
              << (cfg_.requeue_on_failure ? ", requeueing: " : ": ") << result.error() << std::endl;
    ++rejected_;
    return DeliveryOutcome::reject(cfg_.requeue_on_failure);
  }

  std::cout << "[Consumer] job for task " << job->queued_task_id << " done" << std::endl;
  ++acknowledged_;
  return DeliveryOutcome::ack();
}

} // namespace transcode_service
