// subprocess_encoder.cpp
#include "subprocess_encoder.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <sys/wait.h>

namespace transcode_service {

namespace {

// HH:MM:SS(.ff) right after `marker`
std::optional<double> clockAfter(const std::string& line, const std::string& marker) {
  auto pos = line.find(marker);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  pos += marker.size();
  while (pos < line.size() && line[pos] == ' ') {
    ++pos;
  }

  int hours = 0;
  int minutes = 0;
  double seconds = 0;
  if (std::sscanf(line.c_str() + pos, "%d:%d:%lf", &hours, &minutes, &seconds) != 3) {
    return std::nullopt;
  }
  if (hours < 0 || minutes < 0 || seconds < 0) {
    return std::nullopt;
  }
  return hours * 3600.0 + minutes * 60.0 + seconds;
}

std::string joinTail(const std::deque<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    if (!out.empty()) {
      out += '\n';
    }
    out += line;
  }
  return out;
}

} // namespace

SubprocessEncoder::SubprocessEncoder(config::EncoderConfig cfg)
  : cfg_(std::move(cfg)), ffmpeg_available_(checkFFmpegInstalled()) {}

bool SubprocessEncoder::checkFFmpegInstalled() const {
  const std::string command = shellQuote(cfg_.ffmpeg_path) + " -version > /dev/null 2>&1";
  int result = std::system(command.c_str());
  return result == 0;
}

std::string SubprocessEncoder::shellQuote(const std::string& arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::vector<std::string> SubprocessEncoder::buildArguments(const EncodeRequest& request) const {
  const auto& res = request.resolution;
  return {
    "-nostdin",
    "-y",
    "-i", request.input_path,
    "-c:v", cfg_.codec_lib,
    "-c:a", cfg_.audio_codec,
    "-s", dimensions(res),
    "-preset", cfg_.preset,
    "-hls_time", std::to_string(cfg_.segment_seconds),
    "-hls_playlist_type", "vod",
    "-b:v", std::to_string(res.bitrate) + "k",
    "-r", frameRate(res),
    "-hls_segment_filename", (request.output_dir / "segment_%03d.ts").string(),
    (request.output_dir / "index.m3u8").string()
  };
}

std::string SubprocessEncoder::buildCommand(const EncodeRequest& request) const {
  std::string command = shellQuote(cfg_.ffmpeg_path);
  for (const auto& arg : buildArguments(request)) {
    command += " " + shellQuote(arg);
  }
  return command;
}

std::optional<double> SubprocessEncoder::progressSeconds(const std::string& line) {
  return clockAfter(line, "time=");
}

std::optional<double> SubprocessEncoder::durationSeconds(const std::string& line) {
  return clockAfter(line, "Duration:");
}

std::expected<std::filesystem::path, std::string> SubprocessEncoder::encode(
    const EncodeRequest& request,
    const EncodeObserver& observer) {

  if (!ffmpeg_available_) {
    return std::unexpected("FFmpeg is not installed or not found at " + cfg_.ffmpeg_path);
  }

  std::error_code ec;
  std::filesystem::create_directories(request.output_dir, ec);
  if (ec) {
    return std::unexpected("Failed to create " + request.output_dir.string() + ": " + ec.message());
  }

  const std::string command = buildCommand(request);
  FILE* pipe = popen((command + " 2>&1").c_str(), "r");
  if (!pipe) {
    return std::unexpected<std::string>("Failed to start encoder process");
  }
  if (observer.on_start) {
    observer.on_start(command);
  }

  double duration = request.source_duration;
  std::deque<std::string> tail;
  std::string line;

  // ffmpeg ends status lines with '\r' and banner lines with '\n'
  auto flushLine = [&]() {
    if (line.empty()) {
      return;
    }
    if (duration <= 0) {
      if (auto d = durationSeconds(line)) {
        duration = *d;
      }
    }
    if (auto t = progressSeconds(line); t && duration > 0 && observer.on_progress) {
      observer.on_progress(std::min(100.0, *t / duration * 100.0));
    }
    tail.push_back(std::move(line));
    if (tail.size() > kDiagnosticLines) {
      tail.pop_front();
    }
    line.clear();
  };

  std::array<char, 4096> buf;
  size_t n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    for (size_t i = 0; i < n; ++i) {
      if (buf[i] == '\r' || buf[i] == '\n') {
        flushLine();
      } else {
        line += buf[i];
      }
    }
  }
  flushLine();

  int status = pclose(pipe);
  if (status == -1) {
    return std::unexpected<std::string>("Failed to collect encoder exit status");
  }
  if (!WIFEXITED(status)) {
    return std::unexpected("FFmpeg terminated by signal " + std::to_string(WTERMSIG(status)) +
                           "\n" + joinTail(tail));
  }
  if (int code = WEXITSTATUS(status); code != 0) {
    return std::unexpected("FFmpeg command failed with code: " + std::to_string(code) +
                           "\n" + joinTail(tail));
  }

  auto playlist = request.output_dir / "index.m3u8";
  if (!std::filesystem::exists(playlist)) {
    return std::unexpected("FFmpeg exited successfully but " + playlist.string() + " is missing\n" +
                           joinTail(tail));
  }
  if (observer.on_progress) {
    observer.on_progress(100.0);
  }
  return playlist;
}

} // namespace transcode_service
