#pragma once

#include "domain/task.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace transcode_service {

struct TaskUpdate {
  TaskStatus status{TaskStatus::Pending};
  std::optional<std::chrono::system_clock::time_point> start_time;
  std::optional<std::chrono::system_clock::time_point> end_time;
  std::optional<std::string> error_message;
};

// System of record for queued tasks. The pipeline reads pending tasks and
// requests status changes; it never owns the task itself.
class TaskRegistry {
public:
  virtual ~TaskRegistry() = default;

  // At most `limit` tasks, in the registry's order
  virtual std::expected<std::vector<PendingTask>, std::string> fetchPending(std::size_t limit) = 0;

  // Lifecycle transition with timestamps (Processing / Completed / Error)
  virtual std::expected<void, std::string> updateTask(long long task_id, const TaskUpdate& update) = 0;

  // Status-only transition used by the scheduler
  virtual std::expected<void, std::string> updateStatus(
    long long task_id,
    TaskStatus status,
    const std::optional<std::string>& error_message
  ) = 0;

  virtual std::expected<void, std::string> createVideo(long long task_id, const std::string& video_url) = 0;

  // Reachability check used at startup
  virtual std::expected<void, std::string> ping() = 0;
};

} // namespace transcode_service
