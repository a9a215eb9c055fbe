#pragma once

#include <expected>
#include <string>

namespace transcode_service {

struct MediaInfo {
  double duration_seconds{0};
  int width{0};
  int height{0};
  std::string container;
  std::string video_codec;
};

class MediaProbe {
public:
  virtual ~MediaProbe() = default;
  virtual std::expected<MediaInfo, std::string> probe(const std::string& path) = 0;
};

} // namespace transcode_service
