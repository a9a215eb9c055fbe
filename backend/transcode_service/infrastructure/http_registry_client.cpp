#include "http_registry_client.hpp"
#include <cstdio>
#include <stdexcept>
#include <ctime>
#include <iostream>
#include <memory>

namespace transcode_service {

namespace {

std::optional<long long> taskId(const nlohmann::json& task) {
  if (!task.is_object() || !task.contains("id")) {
    return std::nullopt;
  }
  const auto& id = task["id"];
  if (id.is_number_integer()) {
    return id.get<long long>();
  }
  if (id.is_string()) {
    try {
      size_t consumed = 0;
      auto text = id.get<std::string>();
      auto parsed = std::stoll(text, &consumed);
      if (consumed == text.size()) {
        return parsed;
      }
    } catch (const std::exception&) {
    }
  }
  return std::nullopt;
}

std::string truncate(const std::string& text, size_t max = 300) {
  return text.size() <= max ? text : text.substr(0, max) + "...";
}

} // namespace

std::expected<std::vector<PendingTask>, std::string> parsePendingTasks(const std::string& body) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(body);
  } catch (const std::exception& e) {
    return std::unexpected<std::string>(std::string("pending list is not valid JSON: ") + e.what());
  }

  const nlohmann::json* list = nullptr;
  if (j.is_object() && j.contains("data")) {
    list = &j["data"];
  } else if (j.is_array()) {
    list = &j;
  }
  if (list == nullptr || !list->is_array()) {
    return std::unexpected<std::string>("pending list response has no data array");
  }

  std::vector<PendingTask> tasks;
  tasks.reserve(list->size());
  for (const auto& entry : *list) {
    auto id = taskId(entry);
    if (!id) {
      std::cerr << "[Registry] dropping pending entry without id: " << truncate(entry.dump()) << std::endl;
      continue;
    }

    PendingTask task;
    task.id = *id;
    try {
      const auto& upload = entry.at("videoUpload");
      task.source_path = upload.at("path").get<std::string>();
      task.title = upload.value("title", std::string{});
      task.resolutions = upload.at("resolution").get<std::vector<Resolution>>();
    } catch (const std::exception& e) {
      task.invalid_reason = std::string("invalid upload description: ") + e.what();
    }
    tasks.push_back(std::move(task));
  }
  return tasks;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[32] = {0};
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  char out[40] = {0};
  std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, static_cast<long long>(millis));
  return out;
}

nlohmann::json toJson(const TaskUpdate& update) {
  nlohmann::json j = {{"status", toString(update.status)}};
  if (update.start_time) {
    j["start_time"] = formatTimestamp(*update.start_time);
  }
  if (update.end_time) {
    j["end_time"] = formatTimestamp(*update.end_time);
  }
  if (update.error_message) {
    j["error_message"] = *update.error_message;
  }
  return j;
}

HttpRegistryClient::HttpRegistryClient(config::RegistryConfig cfg) : cfg_(std::move(cfg)) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

HttpRegistryClient::~HttpRegistryClient() {
  curl_global_cleanup();
}

std::expected<std::vector<PendingTask>, std::string> HttpRegistryClient::fetchPending(std::size_t limit) {
  auto res = performChecked("GET", "queued-tasks/pendingList?limit=" + std::to_string(limit), std::nullopt);
  if (!res) {
    return std::unexpected(res.error());
  }
  return parsePendingTasks(res->body);
}

std::expected<void, std::string> HttpRegistryClient::updateTask(long long task_id, const TaskUpdate& update) {
  auto res = performChecked("PUT", "queued-tasks/update/" + std::to_string(task_id), toJson(update));
  if (!res) {
    return std::unexpected(res.error());
  }
  return {};
}

std::expected<void, std::string> HttpRegistryClient::updateStatus(
  long long task_id,
  TaskStatus status,
  const std::optional<std::string>& error_message
) {
  nlohmann::json payload = {{"status", toString(status)}};
  if (status == TaskStatus::Error && error_message) {
    payload["error_message"] = *error_message;
  }
  auto res = performChecked("PATCH", "queued-tasks/updateStatus/" + std::to_string(task_id), payload);
  if (!res) {
    return std::unexpected(res.error());
  }
  return {};
}

std::expected<void, std::string> HttpRegistryClient::createVideo(long long task_id, const std::string& video_url) {
  nlohmann::json payload = {
    {"queued_task_id", task_id},
    {"video_url", video_url}
  };
  auto res = performChecked("POST", "videos/create", payload);
  if (!res) {
    return std::unexpected(res.error());
  }
  return {};
}

std::expected<void, std::string> HttpRegistryClient::ping() {
  // any HTTP answer proves reachability
  auto res = perform("GET", "", std::nullopt);
  if (!res) {
    return std::unexpected(res.error());
  }
  return {};
}

std::expected<HttpRegistryClient::Response, std::string> HttpRegistryClient::performChecked(
  const std::string& method,
  const std::string& path,
  const std::optional<nlohmann::json>& body
) {
  auto res = perform(method, path, body);
  if (!res) {
    return res;
  }
  if (res->status < 200 || res->status >= 300) {
    return std::unexpected("HTTP " + std::to_string(res->status) + " from " + method + " " + path +
                           ": " + truncate(res->body));
  }
  return res;
}

std::expected<HttpRegistryClient::Response, std::string> HttpRegistryClient::perform(
  const std::string& method,
  const std::string& path,
  const std::optional<nlohmann::json>& body
) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    return std::unexpected<std::string>("Failed to initialize CURL handle");
  }

  Response response;
  const std::string url = cfg_.base_url + path;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(cfg_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  if (method == "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
  }

  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  if (body) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    const auto payload = body->dump();
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_COPYPOSTFIELDS, payload.c_str());
  }
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);

  auto rc = curl_easy_perform(curl.get());
  curl_slist_free_all(headers);

  if (rc != CURLE_OK) {
    return std::unexpected(method + " " + url + " failed: " + curl_easy_strerror(rc));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

size_t HttpRegistryClient::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

} // namespace transcode_service
