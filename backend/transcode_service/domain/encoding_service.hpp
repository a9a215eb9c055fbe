#pragma once

#include "domain/task.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace transcode_service {

struct EncodeRequest {
  std::string input_path;
  std::filesystem::path output_dir;   // receives index.m3u8 and its segments
  Resolution resolution;
  double source_duration{0};          // seconds, 0 when unknown
};

// Progress is reported for observation only; it never steers the encode
struct EncodeObserver {
  std::function<void(const std::string& command)> on_start;
  std::function<void(double percent)> on_progress;
};

class EncodingService {
public:
  virtual ~EncodingService() = default;

  // Blocks until the encoder finished; returns the written playlist or the encoder's diagnostic
  virtual std::expected<std::filesystem::path, std::string> encode(
    const EncodeRequest& request,
    const EncodeObserver& observer
  ) = 0;
};

} // namespace transcode_service
