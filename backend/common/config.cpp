#include "common/config/config.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace config {

namespace {

std::string envOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

long envLong(const char* name, long fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  size_t consumed = 0;
  long parsed = 0;
  try {
    parsed = std::stol(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
  }
  if (consumed != std::string(value).size()) {
    throw std::invalid_argument(std::string("Invalid numeric value for ") + name + ": " + value);
  }
  return parsed;
}

bool envBool(const char* name, bool fallback) {
  auto value = envOr(name, "");
  if (value.empty()) return fallback;
  return value == "1" || value == "true" || value == "TRUE" || value == "yes";
}

std::string hostName() {
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "transcoder";
  }
  return buf;
}

} // namespace

RedisConfig parseQueueUrl(const std::string& url) {
  const std::string scheme = "redis://";
  if (url.rfind(scheme, 0) != 0) {
    throw std::invalid_argument("Unsupported queue url (expected redis://host:port): " + url);
  }

  RedisConfig redis{.host = "", .port = 6379, .db = 0};
  std::string rest = url.substr(scheme.size());

  if (auto slash = rest.find('/'); slash != std::string::npos) {
    auto db = rest.substr(slash + 1);
    rest = rest.substr(0, slash);
    if (!db.empty()) {
      try {
        redis.db = std::stoi(db);
      } catch (const std::exception&) {
        throw std::invalid_argument("Invalid database index in queue url: " + url);
      }
    }
  }

  if (auto colon = rest.rfind(':'); colon != std::string::npos) {
    auto port = rest.substr(colon + 1);
    rest = rest.substr(0, colon);
    try {
      redis.port = static_cast<unsigned int>(std::stoul(port));
    } catch (const std::exception&) {
      throw std::invalid_argument("Invalid port in queue url: " + url);
    }
  }

  if (rest.empty()) {
    throw std::invalid_argument("Missing host in queue url: " + url);
  }
  redis.host = rest;
  return redis;
}

Config::Config() {
  reload();
}

void Config::reload() {
  queue_ = {
    .url = envOr("QUEUE_URL", "redis://127.0.0.1:6379"),
    .name = envOr("QUEUE_NAME", "transcoding-video"),
    .max_capacity = envLong("MAX_QUEUE_CAPACITY", 10),
    .consumer_tag = envOr("CONSUMER_TAG", hostName()),
    .requeue_on_failure = envBool("REQUEUE_ON_FAILURE", false)
  };

  redis_ = parseQueueUrl(queue_.url);

  queue_cp_ = {
    .min_connections = static_cast<size_t>(envLong("QUEUE_POOL_MIN", 2)),
    .max_connections = static_cast<size_t>(envLong("QUEUE_POOL_MAX", 8)),
    .timeout = std::chrono::milliseconds(5000),
    .idle_timeout = std::chrono::seconds(600)
  };

  scheduler_ = {
    .interval = std::chrono::milliseconds(envLong("SCHEDULER_INTERVAL", 60000))
  };

  storage_ = {
    .upload_dir = envOr("UPLOAD_DIR", "uploads"),
    .output_dir = envOr("TRANSCODE_OUTPUT_DIR", "transcoded-video")
  };

  auto base_url = envOr("API_BASE_URL", "http://localhost:3000/api/");
  if (base_url.back() != '/') {
    base_url += '/';
  }
  registry_ = {
    .base_url = base_url,
    .timeout = std::chrono::milliseconds(envLong("REGISTRY_TIMEOUT_MS", 10000))
  };

  unsigned int hw = std::thread::hardware_concurrency();
  encoder_ = {
    .ffmpeg_path = envOr("FFMPEG_PATH", "/usr/bin/ffmpeg"),
    .codec_lib = "libx264",
    .audio_codec = "aac",
    .preset = envOr("ENCODER_PRESET", "veryfast"),
    .segment_seconds = static_cast<int>(envLong("HLS_SEGMENT_SECONDS", 10)),
    .workers = static_cast<unsigned int>(envLong("ENCODE_WORKERS", hw > 0 ? hw : 2))
  };

  service_ = {
    .host = envOr("SERVICE_HOST", "0.0.0.0"),
    .port = static_cast<int>(envLong("PORT", 4000))
  };

  if (queue_.max_capacity < 0) {
    throw std::invalid_argument("MAX_QUEUE_CAPACITY must not be negative");
  }
  if (scheduler_.interval.count() <= 0) {
    throw std::invalid_argument("SCHEDULER_INTERVAL must be positive");
  }
  if (queue_cp_.max_connections == 0 || queue_cp_.min_connections > queue_cp_.max_connections) {
    throw std::invalid_argument("QUEUE_POOL_MIN/QUEUE_POOL_MAX are inconsistent");
  }
}

} // namespace config
