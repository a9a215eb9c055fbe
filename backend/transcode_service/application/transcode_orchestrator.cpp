#include "transcode_orchestrator.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <future>
#include <iostream>
#include <uuid/uuid.h>

namespace transcode_service {

namespace {

std::string newJobId() {
  uuid_t uuid;
  uuid_generate(uuid);
  char uuid_str[37];
  uuid_unparse(uuid, uuid_str);
  return uuid_str;
}

std::string percent(double value) {
  char buf[16] = {0};
  std::snprintf(buf, sizeof(buf), "%.2f%%", value);
  return buf;
}

} // namespace

TranscodeOrchestrator::TranscodeOrchestrator(std::shared_ptr<TaskRegistry> registry,
                                             std::shared_ptr<EncodingService> encoder,
                                             std::shared_ptr<MediaProbe> probe,
                                             common::ThreadPool& pool,
                                             config::StorageConfig storage)
  : registry_(std::move(registry)),
    encoder_(std::move(encoder)),
    probe_(std::move(probe)),
    pool_(pool),
    storage_(std::move(storage)) {}

std::filesystem::path TranscodeOrchestrator::resolveInput(const std::string& input_path) const {
  std::filesystem::path input(input_path);
  if (input.is_absolute()) {
    return input;
  }
  return std::filesystem::path(storage_.upload_dir) / input;
}

std::expected<JobResult, std::string> TranscodeOrchestrator::run(const JobMessage& job) {
  JobContext ctx;
  ctx.task_id = job.queued_task_id;
  ctx.input = resolveInput(job.input_path);

  if (job.resolutions.empty()) {
    const std::string error = "job requests no resolutions";
    reportError(ctx, error);
    return std::unexpected(error);
  }
  if (auto duplicate = duplicateLabel(job.resolutions); !duplicate.empty()) {
    // both encodes would write the same folder
    const auto error = "job requests " + duplicate + " more than once";
    reportError(ctx, error);
    return std::unexpected(error);
  }

  ctx.job_dir = std::filesystem::path(storage_.output_dir) / newJobId();
  std::error_code ec;
  std::filesystem::create_directories(ctx.job_dir, ec);
  if (ec) {
    const auto error = "Failed to create " + ctx.job_dir.string() + ": " + ec.message();
    reportError(ctx, error);
    return std::unexpected(error);
  }

  auto info = probe_->probe(ctx.input.string());
  if (!info) {
    reportError(ctx, info.error());
    return std::unexpected(info.error());
  }
  ctx.duration = info->duration_seconds;
  std::cout << "[Orchestrator] task " << ctx.task_id << ": " << ctx.input.string() << " ("
            << info->container << "/" << info->video_codec << ", " << info->width << "x" << info->height
            << ", " << info->duration_seconds << "s) -> " << ctx.job_dir.string() << std::endl;

  std::vector<std::future<std::expected<Rendition, std::string>>> futures;
  futures.reserve(job.resolutions.size());
  std::string launch_error;
  for (const auto& resolution : job.resolutions) {
    try {
      futures.push_back(pool_.commit([this, &ctx, resolution]() {
        return encodeRendition(ctx, resolution);
      }));
    } catch (const std::exception& e) {
      launch_error = std::string("Failed to schedule encode: ") + e.what();
      break;
    }
  }

  // every launched encode is joined before ctx goes out of scope
  std::vector<Rendition> renditions;
  std::string first_error = launch_error;
  for (auto& future : futures) {
    auto result = future.get();
    if (result) {
      renditions.push_back(std::move(*result));
    } else if (first_error.empty()) {
      first_error = result.error();
    }
  }

  if (!launch_error.empty()) {
    reportError(ctx, launch_error);
  }
  if (!first_error.empty()) {
    std::cerr << "[Orchestrator] task " << ctx.task_id << " failed, no manifest written: "
              << first_error << std::endl;
    return std::unexpected(first_error);
  }

  auto manifest = writeMasterPlaylist(ctx.job_dir, renditions);
  if (!manifest) {
    reportError(ctx, manifest.error());
    return std::unexpected(manifest.error());
  }
  std::cout << "[Orchestrator] task " << ctx.task_id << ": master playlist " << manifest->string() << std::endl;

  reportCompleted(ctx, *manifest);
  return JobResult{ctx.job_dir, *manifest, std::move(renditions)};
}

std::expected<Rendition, std::string> TranscodeOrchestrator::encodeRendition(JobContext& ctx, const Resolution& resolution) {
  const auto name = label(resolution);
  EncodeRequest request{
    .input_path = ctx.input.string(),
    .output_dir = ctx.job_dir / name,
    .resolution = resolution,
    .source_duration = ctx.duration
  };

  int last_step = -1;
  EncodeObserver observer{
    .on_start = [this, &ctx, &name](const std::string& command) {
      std::cout << "[Encoder] started for " << name << ": " << command << std::endl;
      reportProcessing(ctx);
    },
    .on_progress = [&name, &last_step](double value) {
      int step = static_cast<int>(std::floor(value / 10.0));
      if (step > last_step) {
        last_step = step;
        std::cout << "[Encoder] " << name << ": " << percent(value) << std::endl;
      }
    }
  };

  std::expected<std::filesystem::path, std::string> playlist;
  try {
    playlist = encoder_->encode(request, observer);
  } catch (const std::exception& e) {
    playlist = std::unexpected(std::string("encoder threw: ") + e.what());
  }

  if (!playlist) {
    const auto error = name + ": " + playlist.error();
    std::cerr << "[Encoder] " << error << std::endl;
    reportError(ctx, error);
    return std::unexpected(error);
  }

  std::cout << "[Encoder] " << name << " HLS stream complete" << std::endl;
  return Rendition{resolution, name + "/index.m3u8"};
}

void TranscodeOrchestrator::reportProcessing(JobContext& ctx) {
  std::lock_guard<std::mutex> lock(ctx.mtx);
  if (ctx.reported != Reported::None) {
    return;
  }
  ctx.reported = Reported::Processing;

  TaskUpdate update;
  update.status = TaskStatus::Processing;
  update.start_time = std::chrono::system_clock::now();
  if (auto r = registry_->updateTask(ctx.task_id, update); !r) {
    std::cerr << "[Orchestrator] failed to report Processing for task " << ctx.task_id << ": "
              << r.error() << std::endl;
  }
}

void TranscodeOrchestrator::reportError(JobContext& ctx, const std::string& message) {
  std::lock_guard<std::mutex> lock(ctx.mtx);
  if (ctx.reported == Reported::Error) {
    return;
  }
  ctx.reported = Reported::Error;

  TaskUpdate update;
  update.status = TaskStatus::Error;
  update.end_time = std::chrono::system_clock::now();
  update.error_message = message;
  if (auto r = registry_->updateTask(ctx.task_id, update); !r) {
    std::cerr << "[Orchestrator] failed to report Error for task " << ctx.task_id << ": "
              << r.error() << std::endl;
  }
}

void TranscodeOrchestrator::reportCompleted(const JobContext& ctx, const std::filesystem::path& manifest) {
  if (auto r = registry_->createVideo(ctx.task_id, manifest.string()); !r) {
    std::cerr << "[Orchestrator] failed to create video record for task " << ctx.task_id << ": "
              << r.error() << std::endl;
  }

  TaskUpdate update;
  update.status = TaskStatus::Completed;
  update.end_time = std::chrono::system_clock::now();
  if (auto r = registry_->updateTask(ctx.task_id, update); !r) {
    std::cerr << "[Orchestrator] failed to report Completed for task " << ctx.task_id << ": "
              << r.error() << std::endl;
  }
}

} // namespace transcode_service
