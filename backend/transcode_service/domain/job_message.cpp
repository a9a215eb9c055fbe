#include "domain/job_message.hpp"
#include <nlohmann/json.hpp>

namespace transcode_service {

std::string serialize(const JobMessage& job) {
  nlohmann::json j = {
    {"inputPath", job.input_path},
    {"outputPath", job.output_path},
    {"resolutions", job.resolutions},
    {"queuedTaskId", job.queued_task_id}
  };
  return j.dump();
}

std::expected<JobMessage, std::string> deserializeJob(const std::string& payload) {
  try {
    auto j = nlohmann::json::parse(payload);
    JobMessage job;
    job.input_path = j.at("inputPath").get<std::string>();
    job.output_path = j.value("outputPath", std::string{});
    job.resolutions = j.at("resolutions").get<std::vector<Resolution>>();
    job.queued_task_id = j.at("queuedTaskId").get<long long>();
    if (job.input_path.empty()) {
      return std::unexpected<std::string>("job message has an empty inputPath");
    }
    return job;
  } catch (const std::exception& e) {
    return std::unexpected<std::string>(std::string("malformed job message: ") + e.what());
  }
}

} // namespace transcode_service
