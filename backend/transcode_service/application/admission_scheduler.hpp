#pragma once

#include <atomic>
#include <utility>  // std::exchange, used by <boost/asio/awaitable.hpp> without including it
#include <boost/asio.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "common/config/config.hpp"
#include "domain/job_message.hpp"
#include "domain/job_queue.hpp"
#include "domain/task_registry.hpp"

namespace transcode_service {

namespace net = boost::asio;

struct CycleReport {
  bool skipped{false};        // queue at or above capacity, registry not queried
  std::optional<long> depth;  // ready messages when the cycle started, empty when unreadable
  long available{0};
  std::size_t fetched{0};
  std::size_t published{0};
  std::size_t failed{0};
  std::string error;          // depth or fetch failure that aborted the cycle
  std::chrono::system_clock::time_point finished_at;
};

// Periodically moves pending registry tasks into the work queue without ever
// letting the queue grow past its capacity.
class AdmissionScheduler {
public:
  AdmissionScheduler(std::shared_ptr<JobQueue> queue,
                     std::shared_ptr<TaskRegistry> registry,
                     config::QueueConfig queue_cfg,
                     config::SchedulerConfig scheduler_cfg,
                     config::StorageConfig storage_cfg);
  ~AdmissionScheduler();

  AdmissionScheduler(const AdmissionScheduler&) = delete;
  AdmissionScheduler& operator=(const AdmissionScheduler&) = delete;

  // First cycle runs one interval after start
  void start();
  void stop();

  // Runs one cycle on the calling thread; nullopt when another cycle is in progress
  std::optional<CycleReport> runCycle();
  std::optional<CycleReport> lastReport() const;

  std::expected<JobMessage, std::string> buildJob(const PendingTask& task) const;

private:
  void arm();
  CycleReport admit();
  void fail(const PendingTask& task, const std::string& error, CycleReport& report);
  void record(const CycleReport& report);

  std::shared_ptr<JobQueue> queue_;
  std::shared_ptr<TaskRegistry> registry_;
  config::QueueConfig queue_cfg_;
  config::SchedulerConfig scheduler_cfg_;
  config::StorageConfig storage_cfg_;

  net::io_context io_;
  net::steady_timer timer_;
  std::jthread thread_;
  std::atomic_bool running_{false};

  std::mutex cycle_mutex_;
  mutable std::mutex report_mutex_;
  std::optional<CycleReport> last_report_;
};

} // namespace transcode_service
