#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace transcode_service {

// One target rendition of a video
struct Resolution {
  int width{0};
  int height{0};
  long bitrate{0};   // kbit/s
  double fps{0};    // may be fractional (29.97)
};

// "720p"
std::string label(const Resolution& resolution);
// "1280x720"
std::string dimensions(const Resolution& resolution);
// bit/s
long bandwidth(const Resolution& resolution);
// "30", "29.97"; the value handed to the encoder's -r
std::string frameRate(const Resolution& resolution);

// Every rendition is written to its own label() folder. Returns the first label
// requested more than once, empty when there is none.
std::string duplicateLabel(const std::vector<Resolution>& resolutions);

// bitrate and fps are accepted as numbers or numeric strings ("800", "800k")
void from_json(const nlohmann::json& j, Resolution& resolution);
void to_json(nlohmann::json& j, const Resolution& resolution);

enum class TaskStatus {
  Pending,
  Queued,
  Processing,
  Completed,
  Error
};

const char* toString(TaskStatus status);

// A registry entry awaiting transcoding. invalid_reason is set when the registry
// returned the task but its upload description could not be read.
struct PendingTask {
  long long id{0};
  std::string source_path;
  std::string title;
  std::vector<Resolution> resolutions;
  std::string invalid_reason;
};

} // namespace transcode_service
