#pragma once

#include "domain/task.hpp"

#include <expected>
#include <string>
#include <vector>

namespace transcode_service {

// Queue payload for one transcoding unit of work; immutable once published
struct JobMessage {
  std::string input_path;
  std::string output_path;   // hint only, the orchestrator picks its own directory
  std::vector<Resolution> resolutions;
  long long queued_task_id{0};
};

// {"inputPath","outputPath","resolutions":[...],"queuedTaskId"}
std::string serialize(const JobMessage& job);
std::expected<JobMessage, std::string> deserializeJob(const std::string& payload);

} // namespace transcode_service
