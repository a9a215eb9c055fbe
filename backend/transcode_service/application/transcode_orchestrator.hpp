#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "application/master_playlist.hpp"
#include "common/config/config.hpp"
#include "common/thread_pool.hpp"
#include "domain/encoding_service.hpp"
#include "domain/job_message.hpp"
#include "domain/media_probe.hpp"
#include "domain/task_registry.hpp"

namespace transcode_service {

struct JobResult {
  std::filesystem::path job_dir;
  std::filesystem::path manifest;
  std::vector<Rendition> renditions;
};

// Turns one job into an HLS package: one encode per resolution on the shared
// pool, a master playlist once all of them succeeded, and the matching status
// transitions at the registry.
class TranscodeOrchestrator {
public:
  TranscodeOrchestrator(std::shared_ptr<TaskRegistry> registry,
                        std::shared_ptr<EncodingService> encoder,
                        std::shared_ptr<MediaProbe> probe,
                        common::ThreadPool& pool,
                        config::StorageConfig storage);

  std::expected<JobResult, std::string> run(const JobMessage& job);

  // Relative inputs live under the upload directory
  std::filesystem::path resolveInput(const std::string& input_path) const;

private:
  enum class Reported { None, Processing, Error };

  // Shared by the encodes of one job. Processing is reported at most once and
  // never after Error.
  struct JobContext {
    long long task_id{0};
    std::filesystem::path input;
    std::filesystem::path job_dir;
    double duration{0};

    std::mutex mtx;
    Reported reported{Reported::None};
  };

  std::expected<Rendition, std::string> encodeRendition(JobContext& ctx, const Resolution& resolution);

  void reportProcessing(JobContext& ctx);
  void reportError(JobContext& ctx, const std::string& message);
  void reportCompleted(const JobContext& ctx, const std::filesystem::path& manifest);

  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<EncodingService> encoder_;
  std::shared_ptr<MediaProbe> probe_;
  common::ThreadPool& pool_;
  config::StorageConfig storage_;
};

} // namespace transcode_service
