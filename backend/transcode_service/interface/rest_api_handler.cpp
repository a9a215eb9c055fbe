#include "rest_api_handler.hpp"
#include "infrastructure/http_registry_client.hpp"

namespace transcode_service {

RestApiHandler::RestApiHandler(std::shared_ptr<AdmissionScheduler> scheduler,
                               std::shared_ptr<JobConsumer> consumer,
                               config::QueueConfig queue_cfg)
    : scheduler_(std::move(scheduler)),
      consumer_(std::move(consumer)),
      queue_cfg_(std::move(queue_cfg)) {}

http::response<http::string_body> RestApiHandler::doHandleRequest(
    http::request<http::string_body> &&req) {
  std::string target = std::string(req.target());
  if (auto query = target.find('?'); query != std::string::npos) {
    target.resize(query);
  }

  if (target == "/" && req.method() == http::verb::get) {
    return createTextResponse(http::status::ok, "Transcoding service is running");
  } else if (target == "/api/transcode/status" && req.method() == http::verb::get) {
    return handleStatus();
  } else {
    return createErrorResponse(http::status::not_found, "Endpoint not found");
  }
}

http::response<http::string_body> RestApiHandler::handleStatus() {
  const auto report = scheduler_->lastReport();

  // depth as read by the last admission cycle
  nlohmann::json queue = {
    {"name", queue_cfg_.name},
    {"capacity", queue_cfg_.max_capacity},
    {"depth", nullptr}
  };
  if (report && report->depth) {
    queue["depth"] = *report->depth;
    queue["observed_at"] = formatTimestamp(report->finished_at);
  } else if (report && !report->error.empty()) {
    queue["error"] = report->error;
  }

  nlohmann::json scheduler = nullptr;
  if (report) {
    scheduler = {
      {"skipped", report->skipped},
      {"available", report->available},
      {"fetched", report->fetched},
      {"published", report->published},
      {"failed", report->failed},
      {"finished_at", formatTimestamp(report->finished_at)}
    };
    if (!report->error.empty()) {
      scheduler["error"] = report->error;
    }
  }

  nlohmann::json response_json = {
    {"success", true},
    {"queue", queue},
    {"scheduler", {{"last_cycle", scheduler}}},
    {"consumer", {
      {"acknowledged", consumer_->acknowledged()},
      {"rejected", consumer_->rejected()}
    }}
  };
  return createJsonResponse(http::status::ok, response_json);
}

} // namespace transcode_service
