// subprocess_encoder.hpp
#pragma once

#include "common/config/config.hpp"
#include "domain/encoding_service.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace transcode_service {

// Runs the ffmpeg binary once per rendition and writes a VOD HLS playlist
// (index.m3u8 + segment_NNN.ts) into the request's output directory.
class SubprocessEncoder : public EncodingService {
public:
  explicit SubprocessEncoder(config::EncoderConfig cfg);

  std::expected<std::filesystem::path, std::string> encode(
    const EncodeRequest& request,
    const EncodeObserver& observer
  ) override;

  bool available() const { return ffmpeg_available_; }

  // Arguments after the binary name, unquoted
  std::vector<std::string> buildArguments(const EncodeRequest& request) const;
  std::string buildCommand(const EncodeRequest& request) const;

  // Seconds of the "time=HH:MM:SS.ss" field of an ffmpeg status line
  static std::optional<double> progressSeconds(const std::string& line);
  // Seconds of the "Duration: HH:MM:SS.ss" field of ffmpeg's input banner
  static std::optional<double> durationSeconds(const std::string& line);

  static std::string shellQuote(const std::string& arg);

private:
  static constexpr size_t kDiagnosticLines = 20;

  bool checkFFmpegInstalled() const;

  config::EncoderConfig cfg_;
  bool ffmpeg_available_;
};

} // namespace transcode_service
