#pragma once
#include "application/admission_scheduler.hpp"
#include "application/job_consumer.hpp"
#include "common/config/config.hpp"
#include "common/restful/rest_api_handler_base.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace transcode_service {

// GET /                       liveness
// GET /api/transcode/status   queue depth, last admission cycle, consumer counters
// Answers from state already held in memory, the io thread never waits on the broker.
class RestApiHandler : public common::RestApiHandlerBase {
public:
  RestApiHandler(std::shared_ptr<AdmissionScheduler> scheduler,
                 std::shared_ptr<JobConsumer> consumer,
                 config::QueueConfig queue_cfg);

protected:
  http::response<http::string_body> doHandleRequest(
      http::request<http::string_body> &&req) override;

private:
  std::shared_ptr<AdmissionScheduler> scheduler_;
  std::shared_ptr<JobConsumer> consumer_;
  config::QueueConfig queue_cfg_;

  http::response<http::string_body> handleStatus();
};

} // namespace transcode_service
