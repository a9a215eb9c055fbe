#include "domain/task.hpp"
#include <cmath>
#include <cstdio>
#include <set>
#include <stdexcept>

namespace transcode_service {

namespace {

double numberField(const nlohmann::json& j, const char* key) {
  const auto& value = j.at(key);
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    auto text = value.get<std::string>();
    if (!text.empty() && (text.back() == 'k' || text.back() == 'K')) {
      text.pop_back();
    }
    size_t consumed = 0;
    double parsed = 0;
    try {
      parsed = std::stod(text, &consumed);
    } catch (const std::exception&) {
      consumed = 0;
    }
    if (consumed != 0 && consumed == text.size() && std::isfinite(parsed)) {
      return parsed;
    }
  }
  throw std::invalid_argument(std::string("resolution field '") + key + "' is not numeric");
}

} // namespace

std::string label(const Resolution& resolution) {
  return std::to_string(resolution.height) + "p";
}

std::string dimensions(const Resolution& resolution) {
  return std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
}

long bandwidth(const Resolution& resolution) {
  return resolution.bitrate * 1000;
}

std::string frameRate(const Resolution& resolution) {
  char buf[32] = {0};
  std::snprintf(buf, sizeof(buf), "%.6g", resolution.fps);
  return buf;
}

std::string duplicateLabel(const std::vector<Resolution>& resolutions) {
  std::set<std::string> seen;
  for (const auto& resolution : resolutions) {
    auto name = label(resolution);
    if (!seen.insert(name).second) {
      return name;
    }
  }
  return {};
}

void from_json(const nlohmann::json& j, Resolution& resolution) {
  resolution.width = static_cast<int>(numberField(j, "width"));
  resolution.height = static_cast<int>(numberField(j, "height"));
  resolution.bitrate = static_cast<long>(numberField(j, "bitrate"));
  resolution.fps = numberField(j, "fps");
  if (resolution.width <= 0 || resolution.height <= 0 || resolution.bitrate <= 0 || resolution.fps <= 0) {
    throw std::invalid_argument("resolution " + dimensions(resolution) + " has non-positive parameters");
  }
}

void to_json(nlohmann::json& j, const Resolution& resolution) {
  j = nlohmann::json{
    {"width", resolution.width},
    {"height", resolution.height},
    {"bitrate", resolution.bitrate},
    {"fps", resolution.fps}
  };
}

const char* toString(TaskStatus status) {
  switch (status) {
    case TaskStatus::Pending: return "Pending";
    case TaskStatus::Queued: return "Queued";
    case TaskStatus::Processing: return "Processing";
    case TaskStatus::Completed: return "Completed";
    case TaskStatus::Error: return "Error";
  }
  return "Unknown";
}

} // namespace transcode_service
