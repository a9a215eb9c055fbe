#pragma once

// project
#include "domain/media_probe.hpp"

// std
#include <expected>
#include <string>

// ffmpeg
extern "C" {
  #include <libavcodec/avcodec.h>
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace transcode_service {

class AvMediaProbe : public MediaProbe {
public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  explicit AvMediaProbe(int loglevel = AV_LOG_ERROR);

  // Reads container headers only, nothing is decoded
  std::expected<MediaInfo, std::string> probe(const std::string& path) override;
};

} // namespace transcode_service
