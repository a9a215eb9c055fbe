#pragma once
#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "common/config/config.hpp"
#include "domain/task_registry.hpp"

namespace transcode_service {

// Body of GET queued-tasks/pendingList: {"data":[{"id", "videoUpload":{"path","title","resolution":[...]}}]}
// Entries without a usable id are dropped; other defects land in PendingTask::invalid_reason.
std::expected<std::vector<PendingTask>, std::string> parsePendingTasks(const std::string& body);

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.123Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

nlohmann::json toJson(const TaskUpdate& update);

class HttpRegistryClient : public TaskRegistry {
public:
  explicit HttpRegistryClient(config::RegistryConfig cfg);
  ~HttpRegistryClient() override;

  HttpRegistryClient(const HttpRegistryClient&) = delete;
  HttpRegistryClient& operator=(const HttpRegistryClient&) = delete;

  std::expected<std::vector<PendingTask>, std::string> fetchPending(std::size_t limit) override;
  std::expected<void, std::string> updateTask(long long task_id, const TaskUpdate& update) override;
  std::expected<void, std::string> updateStatus(
    long long task_id,
    TaskStatus status,
    const std::optional<std::string>& error_message
  ) override;
  std::expected<void, std::string> createVideo(long long task_id, const std::string& video_url) override;
  std::expected<void, std::string> ping() override;

private:
  struct Response {
    long status{0};
    std::string body;
  };

  // One easy handle per request: the client is shared by the scheduler and the encode workers
  std::expected<Response, std::string> perform(
    const std::string& method,
    const std::string& path,
    const std::optional<nlohmann::json>& body
  );
  std::expected<Response, std::string> performChecked(
    const std::string& method,
    const std::string& path,
    const std::optional<nlohmann::json>& body
  );

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);

  config::RegistryConfig cfg_;
};

} // namespace transcode_service
