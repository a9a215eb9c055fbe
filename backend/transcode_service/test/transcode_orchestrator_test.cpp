#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <latch>
#include <thread>

#include "application/transcode_orchestrator.hpp"
#include "test_doubles.hpp"

using namespace transcode_service;
using namespace transcode_service::test;

namespace {

class TranscodeOrchestratorTest : public ::testing::Test {
protected:
  TranscodeOrchestratorTest()
    : registry_(std::make_shared<RecordingRegistry>()),
      encoder_(std::make_shared<FakeEncoder>()),
      probe_(std::make_shared<FakeProbe>()),
      pool_(4),
      orchestrator_(registry_, encoder_, probe_, pool_,
                    config::StorageConfig{.upload_dir = (root_.path() / "uploads").string(),
                                          .output_dir = (root_.path() / "out").string()}) {}

  JobMessage job(std::vector<Resolution> resolutions, long long id = 21) {
    JobMessage j;
    j.input_path = "lecture.mp4";
    j.output_path = "hint";
    j.resolutions = std::move(resolutions);
    j.queued_task_id = id;
    return j;
  }

  size_t countStatus(TaskStatus status) {
    auto updates = registry_->updates();
    return std::count_if(updates.begin(), updates.end(),
                         [status](const RecordingRegistry::Update& u) { return u.update.status == status; });
  }

  TempDir root_;
  std::shared_ptr<RecordingRegistry> registry_;
  std::shared_ptr<FakeEncoder> encoder_;
  std::shared_ptr<FakeProbe> probe_;
  common::ThreadPool pool_;
  TranscodeOrchestrator orchestrator_;
};

// Each encode waits until all of them have started, so it only succeeds when
// the renditions are encoded at the same time
class RendezvousEncoder : public EncodingService {
public:
  explicit RendezvousEncoder(std::ptrdiff_t expected) : arrived_(expected) {}

  std::expected<std::filesystem::path, std::string> encode(
      const EncodeRequest& request, const EncodeObserver& observer) override {
    if (observer.on_start) observer.on_start("ffmpeg " + label(request.resolution));
    arrived_.count_down();

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!arrived_.try_wait()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return std::unexpected<std::string>("other renditions never started");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto playlist = request.output_dir / "index.m3u8";
    writeFile(playlist, "#EXTM3U\n#EXT-X-ENDLIST\n");
    return playlist;
  }

private:
  std::latch arrived_;
};

} // namespace

TEST_F(TranscodeOrchestratorTest, SuccessfulJobWritesManifestAndReportsCompletion) {
  auto result = orchestrator_.run(job({res360(), res720()}));
  ASSERT_TRUE(result.has_value()) << result.error();

  EXPECT_EQ(result->job_dir.parent_path(), root_.path() / "out");
  EXPECT_EQ(result->manifest, result->job_dir / "master.m3u8");
  ASSERT_EQ(result->renditions.size(), 2u);
  EXPECT_EQ(result->renditions[0].playlist, "360p/index.m3u8");
  EXPECT_EQ(result->renditions[1].playlist, "720p/index.m3u8");

  EXPECT_EQ(readFile(result->manifest),
            "#EXTM3U\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=800000,RESOLUTION=640x360\n"
            "360p/index.m3u8\n"
            "#EXT-X-STREAM-INF:BANDWIDTH=2500000,RESOLUTION=1280x720\n"
            "720p/index.m3u8\n");

  auto requests = encoder_->requests();
  ASSERT_EQ(requests.size(), 2u);
  for (const auto& r : requests) {
    EXPECT_EQ(r.output_dir, result->job_dir / label(r.resolution));
    EXPECT_DOUBLE_EQ(r.source_duration, 12.5);
  }

  auto updates = registry_->updatesFor(21);
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(updates.front().update.status, TaskStatus::Processing);
  EXPECT_TRUE(updates.front().update.start_time.has_value());
  EXPECT_EQ(updates.back().update.status, TaskStatus::Completed);
  EXPECT_TRUE(updates.back().update.end_time.has_value());

  auto videos = registry_->videos();
  ASSERT_EQ(videos.size(), 1u);
  EXPECT_EQ(videos[0].first, 21);
  EXPECT_EQ(videos[0].second, result->manifest.string());
}

TEST_F(TranscodeOrchestratorTest, OneFailedRenditionFailsWholeJob) {
  encoder_->failFor("720p", "FFmpeg command failed with code: 1\nConversion failed!");

  auto result = orchestrator_.run(job({res360(), res720()}, 33));
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("Conversion failed!"), std::string::npos);

  auto updates = registry_->updatesFor(33);
  ASSERT_FALSE(updates.empty());
  const auto& last = updates.back().update;
  EXPECT_EQ(last.status, TaskStatus::Error);
  ASSERT_TRUE(last.error_message.has_value());
  EXPECT_NE(last.error_message->find("720p"), std::string::npos);
  EXPECT_NE(last.error_message->find("Conversion failed!"), std::string::npos);
  EXPECT_TRUE(last.end_time.has_value());

  EXPECT_EQ(countStatus(TaskStatus::Completed), 0u);
  EXPECT_EQ(countStatus(TaskStatus::Error), 1u);
  EXPECT_LE(countStatus(TaskStatus::Processing), 1u);
  EXPECT_TRUE(registry_->videos().empty());

  // no manifest, the successful rendition's output stays
  std::vector<std::filesystem::path> job_dirs;
  for (const auto& entry : std::filesystem::directory_iterator(root_.path() / "out")) {
    job_dirs.push_back(entry.path());
  }
  ASSERT_EQ(job_dirs.size(), 1u);
  EXPECT_FALSE(std::filesystem::exists(job_dirs[0] / "master.m3u8"));
  EXPECT_TRUE(std::filesystem::exists(job_dirs[0] / "360p" / "index.m3u8"));
}

TEST_F(TranscodeOrchestratorTest, EveryRenditionFailingReportsErrorOnce) {
  encoder_->failFor("360p", "bad input");
  encoder_->failFor("720p", "bad input");

  EXPECT_FALSE(orchestrator_.run(job({res360(), res720()})).has_value());
  EXPECT_EQ(countStatus(TaskStatus::Error), 1u);
  EXPECT_EQ(registry_->updates().back().update.status, TaskStatus::Error);
}

TEST_F(TranscodeOrchestratorTest, ProbeFailureStopsBeforeEncoding) {
  probe_->fail("Could not open input file lecture.mp4: No such file or directory");

  auto result = orchestrator_.run(job({res360()}));
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(encoder_->requests().empty());

  auto updates = registry_->updates();
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(updates[0].update.status, TaskStatus::Error);
  EXPECT_EQ(*updates[0].update.error_message, "Could not open input file lecture.mp4: No such file or directory");
}

TEST_F(TranscodeOrchestratorTest, EmptyResolutionListIsAFailure) {
  auto result = orchestrator_.run(job({}));
  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(encoder_->requests().empty());
  EXPECT_EQ(countStatus(TaskStatus::Error), 1u);
}

TEST_F(TranscodeOrchestratorTest, ResolvesRelativeInputsAgainstUploadDirectory) {
  EXPECT_EQ(orchestrator_.resolveInput("a/b.mp4"), root_.path() / "uploads" / "a/b.mp4");
  EXPECT_EQ(orchestrator_.resolveInput("/srv/media/b.mp4"), std::filesystem::path("/srv/media/b.mp4"));

  ASSERT_TRUE(orchestrator_.run(job({res360()})).has_value());
  ASSERT_EQ(probe_->probed().size(), 1u);
  EXPECT_EQ(probe_->probed()[0], (root_.path() / "uploads" / "lecture.mp4").string());
}

TEST_F(TranscodeOrchestratorTest, ReportingFailuresDoNotChangeOutcome) {
  registry_->failReporting(true);
  auto result = orchestrator_.run(job({res360(), res720()}));
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(std::filesystem::exists(result->manifest));
}

TEST_F(TranscodeOrchestratorTest, EachJobGetsItsOwnDirectory) {
  auto first = orchestrator_.run(job({res360()}, 1));
  auto second = orchestrator_.run(job({res360()}, 2));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(first->job_dir, second->job_dir);
}

TEST_F(TranscodeOrchestratorTest, RepeatedRenditionLabelFailsBeforeEncoding) {
  auto wide = res720();
  wide.width = 1920;
  auto result = orchestrator_.run(job({res720(), wide}));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), "job requests 720p more than once");
  EXPECT_TRUE(encoder_->requests().empty());
  EXPECT_EQ(countStatus(TaskStatus::Error), 1u);
}

TEST(TranscodeOrchestratorConcurrencyTest, RenditionsAreEncodedSimultaneously) {
  TempDir root;
  auto registry = std::make_shared<RecordingRegistry>();
  common::ThreadPool pool(2);
  TranscodeOrchestrator orchestrator(registry, std::make_shared<RendezvousEncoder>(2),
                                     std::make_shared<FakeProbe>(), pool,
                                     config::StorageConfig{.upload_dir = (root.path() / "uploads").string(),
                                                           .output_dir = (root.path() / "out").string()});
  JobMessage job;
  job.input_path = "lecture.mp4";
  job.resolutions = {res360(), res720()};
  job.queued_task_id = 40;

  auto result = orchestrator.run(job);
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->renditions.size(), 2u);
  EXPECT_EQ(registry->updates().back().update.status, TaskStatus::Completed);
}
