#include "admission_scheduler.hpp"

#include <iostream>

namespace transcode_service {

AdmissionScheduler::AdmissionScheduler(std::shared_ptr<JobQueue> queue,
                                       std::shared_ptr<TaskRegistry> registry,
                                       config::QueueConfig queue_cfg,
                                       config::SchedulerConfig scheduler_cfg,
                                       config::StorageConfig storage_cfg)
  : queue_(std::move(queue)),
    registry_(std::move(registry)),
    queue_cfg_(std::move(queue_cfg)),
    scheduler_cfg_(scheduler_cfg),
    storage_cfg_(std::move(storage_cfg)),
    timer_(io_) {}

AdmissionScheduler::~AdmissionScheduler() {
  stop();
}

void AdmissionScheduler::start() {
  if (running_.exchange(true)) {
    return;
  }
  io_.restart();
  arm();
  thread_ = std::jthread([this] {
    io_.run();
  });
  std::cout << "[Scheduler] started, interval " << scheduler_cfg_.interval.count() << "ms, capacity "
            << queue_cfg_.max_capacity << std::endl;
}

void AdmissionScheduler::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  // a cycle in progress finishes first
  io_.stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  timer_.cancel();
  std::cout << "[Scheduler] stopped" << std::endl;
}

void AdmissionScheduler::arm() {
  timer_.expires_after(scheduler_cfg_.interval);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !running_) {
      return;
    }
    runCycle();
    // next tick is counted from the end of this cycle
    arm();
  });
}

std::optional<CycleReport> AdmissionScheduler::runCycle() {
  std::unique_lock<std::mutex> lock(cycle_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    std::cout << "[Scheduler] previous cycle still running. Skipping." << std::endl;
    return std::nullopt;
  }

  CycleReport report;
  try {
    report = admit();
  } catch (const std::exception& e) {
    report.error = std::string("cycle aborted: ") + e.what();
    std::cerr << "[Scheduler] " << report.error << std::endl;
  }
  report.finished_at = std::chrono::system_clock::now();
  record(report);
  return report;
}

CycleReport AdmissionScheduler::admit() {
  CycleReport report;

  auto depth = queue_->depth(queue_cfg_.name);
  if (!depth) {
    report.error = "Failed to read queue depth: " + depth.error();
    std::cerr << "[Scheduler] " << report.error << std::endl;
    return report;
  }

  report.depth = *depth;
  report.available = queue_cfg_.max_capacity - *depth;
  if (report.available <= 0) {
    report.skipped = true;
    std::cout << "[Scheduler] Queue is full (" << *depth << "/" << queue_cfg_.max_capacity
              << "). Skipping this cycle." << std::endl;
    return report;
  }

  auto tasks = registry_->fetchPending(static_cast<std::size_t>(report.available));
  if (!tasks) {
    report.error = "Failed to fetch pending tasks: " + tasks.error();
    std::cerr << "[Scheduler] " << report.error << std::endl;
    return report;
  }

  report.fetched = tasks->size();
  if (tasks->empty()) {
    std::cout << "[Scheduler] No pending tasks to process." << std::endl;
    return report;
  }
  if (tasks->size() > static_cast<std::size_t>(report.available)) {
    std::cerr << "[Scheduler] registry returned " << tasks->size() << " tasks for " << report.available
              << " free slots, admitting the first " << report.available << std::endl;
    tasks->resize(static_cast<std::size_t>(report.available));
  }

  for (const auto& task : *tasks) {
    auto job = buildJob(task);
    if (!job) {
      fail(task, job.error(), report);
      continue;
    }
    if (auto published = queue_->publish(queue_cfg_.name, serialize(*job), true); !published) {
      fail(task, published.error(), report);
      continue;
    }
    ++report.published;
    std::cout << "[Scheduler] queued task " << task.id << " (" << job->resolutions.size()
              << " renditions)" << std::endl;
  }

  std::cout << "[Scheduler] cycle done: " << report.published << " published, " << report.failed
            << " failed, " << report.available << " slots were free" << std::endl;
  return report;
}

std::expected<JobMessage, std::string> AdmissionScheduler::buildJob(const PendingTask& task) const {
  if (!task.invalid_reason.empty()) {
    return std::unexpected(task.invalid_reason);
  }
  if (task.source_path.empty()) {
    return std::unexpected<std::string>("task has no source path");
  }
  if (task.resolutions.empty()) {
    return std::unexpected<std::string>("task requests no resolutions");
  }
  if (auto duplicate = duplicateLabel(task.resolutions); !duplicate.empty()) {
    return std::unexpected("task requests " + duplicate + " more than once");
  }

  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  const auto name = task.title.empty() ? std::to_string(task.id) : task.title;

  JobMessage job;
  job.input_path = task.source_path;
  job.output_path = storage_cfg_.output_dir + "/" + std::to_string(millis) + "-" + name;
  job.resolutions = task.resolutions;
  job.queued_task_id = task.id;
  return job;
}

void AdmissionScheduler::fail(const PendingTask& task, const std::string& error, CycleReport& report) {
  ++report.failed;
  std::cerr << "[Scheduler] task " << task.id << " not queued: " << error << std::endl;
  if (auto r = registry_->updateStatus(task.id, TaskStatus::Error, error); !r) {
    std::cerr << "[Scheduler] failed to report Error for task " << task.id << ": " << r.error() << std::endl;
  }
}

void AdmissionScheduler::record(const CycleReport& report) {
  std::lock_guard<std::mutex> lock(report_mutex_);
  last_report_ = report;
}

std::optional<CycleReport> AdmissionScheduler::lastReport() const {
  std::lock_guard<std::mutex> lock(report_mutex_);
  return last_report_;
}

} // namespace transcode_service
