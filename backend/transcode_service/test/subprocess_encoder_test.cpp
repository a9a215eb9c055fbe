#include <gtest/gtest.h>

#include <algorithm>

#include "infrastructure/subprocess_encoder.hpp"
#include "test_doubles.hpp"

using namespace transcode_service;
using namespace transcode_service::test;

namespace {

// Stand-in ffmpeg: answers -version, prints a banner and one status line, writes the last argument
const char* kWorkingEncoder =
  "#!/bin/sh\n"
  "if [ \"$1\" = \"-version\" ]; then echo 'ffmpeg version test'; exit 0; fi\n"
  "echo '  Duration: 00:00:10.00, start: 0.000000, bitrate: 1000 kb/s' >&2\n"
  "printf 'frame=  10 fps=0.0 q=28.0 size=N/A time=00:00:05.00 bitrate=N/A speed=10x\\r' >&2\n"
  "for last; do :; done\n"
  "echo '#EXTM3U' > \"$last\"\n"
  "exit 0\n";

const char* kFailingEncoder =
  "#!/bin/sh\n"
  "if [ \"$1\" = \"-version\" ]; then exit 0; fi\n"
  "i=1\n"
  "while [ $i -le 30 ]; do echo \"noise $i\" >&2; i=$((i+1)); done\n"
  "echo 'Conversion failed!' >&2\n"
  "exit 1\n";

const char* kSilentEncoder =
  "#!/bin/sh\n"
  "exit 0\n";

config::EncoderConfig encoderConfig(const std::filesystem::path& binary) {
  return config::EncoderConfig{
    .ffmpeg_path = binary.string(),
    .codec_lib = "libx264",
    .audio_codec = "aac",
    .preset = "veryfast",
    .segment_seconds = 10,
    .workers = 2
  };
}

std::filesystem::path installScript(const TempDir& dir, const std::string& name, const char* body) {
  auto path = dir.path() / name;
  writeFile(path, body);
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

} // namespace

TEST(SubprocessEncoderTest, BuildsHlsArguments) {
  SubprocessEncoder encoder(encoderConfig("/nonexistent/ffmpeg"));
  EncodeRequest request{
    .input_path = "uploads/in.mp4",
    .output_dir = "out/job/720p",
    .resolution = res720(),
    .source_duration = 0
  };

  std::vector<std::string> expected = {
    "-nostdin", "-y", "-i", "uploads/in.mp4",
    "-c:v", "libx264", "-c:a", "aac",
    "-s", "1280x720",
    "-preset", "veryfast",
    "-hls_time", "10",
    "-hls_playlist_type", "vod",
    "-b:v", "2500k",
    "-r", "30",
    "-hls_segment_filename", "out/job/720p/segment_%03d.ts",
    "out/job/720p/index.m3u8"
  };
  EXPECT_EQ(encoder.buildArguments(request), expected);
}

TEST(SubprocessEncoderTest, KeepsFractionalFrameRates) {
  SubprocessEncoder encoder(encoderConfig("/nonexistent/ffmpeg"));
  auto resolution = res720();
  resolution.fps = 29.97;
  auto args = encoder.buildArguments(EncodeRequest{.input_path = "in.mp4", .output_dir = "out/720p",
                                                   .resolution = resolution, .source_duration = 0});

  auto rate = std::find(args.begin(), args.end(), "-r");
  ASSERT_NE(rate, args.end());
  ASSERT_NE(rate + 1, args.end());
  EXPECT_EQ(*(rate + 1), "29.97");
}

// ffmpeg must never read the service's stdin
TEST(SubprocessEncoderTest, EncoderDoesNotReadStdin) {
  SubprocessEncoder encoder(encoderConfig("/nonexistent/ffmpeg"));
  auto args = encoder.buildArguments(EncodeRequest{.input_path = "in.mp4", .output_dir = "out/360p",
                                                   .resolution = res360(), .source_duration = 0});
  ASSERT_FALSE(args.empty());
  EXPECT_EQ(args.front(), "-nostdin");
}

TEST(SubprocessEncoderTest, QuotesEveryArgumentForTheShell) {
  EXPECT_EQ(SubprocessEncoder::shellQuote("plain"), "'plain'");
  EXPECT_EQ(SubprocessEncoder::shellQuote("my video's.mp4"), "'my video'\\''s.mp4'");
  EXPECT_EQ(SubprocessEncoder::shellQuote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(SubprocessEncoderTest, ParsesStatusAndBannerClocks) {
  auto t = SubprocessEncoder::progressSeconds("frame=  42 fps=25 time=00:01:02.50 bitrate=1000kbits/s");
  ASSERT_TRUE(t.has_value());
  EXPECT_DOUBLE_EQ(*t, 62.5);
  EXPECT_FALSE(SubprocessEncoder::progressSeconds("size=N/A time=N/A bitrate=N/A").has_value());
  EXPECT_FALSE(SubprocessEncoder::progressSeconds("Stream mapping:").has_value());

  auto d = SubprocessEncoder::durationSeconds("  Duration: 01:00:00.00, start: 0.000000, bitrate: 1 kb/s");
  ASSERT_TRUE(d.has_value());
  EXPECT_DOUBLE_EQ(*d, 3600.0);
}

TEST(SubprocessEncoderTest, MissingBinaryIsReportedAsError) {
  TempDir dir;
  SubprocessEncoder encoder(encoderConfig(dir.path() / "no-ffmpeg"));
  EXPECT_FALSE(encoder.available());

  auto result = encoder.encode(EncodeRequest{.input_path = "in.mp4", .output_dir = dir.path() / "360p",
                                             .resolution = res360(), .source_duration = 0}, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("not installed"), std::string::npos);
}

TEST(SubprocessEncoderTest, RunsEncoderAndReportsProgress) {
  TempDir dir;
  SubprocessEncoder encoder(encoderConfig(installScript(dir, "ffmpeg", kWorkingEncoder)));
  ASSERT_TRUE(encoder.available());

  std::string started;
  std::vector<double> progress;
  EncodeObserver observer{
    .on_start = [&started](const std::string& command) { started = command; },
    .on_progress = [&progress](double p) { progress.push_back(p); }
  };

  auto out = dir.path() / "job" / "360p";
  auto result = encoder.encode(EncodeRequest{.input_path = "in file.mp4", .output_dir = out,
                                             .resolution = res360(), .source_duration = 0}, observer);
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(*result, out / "index.m3u8");
  EXPECT_TRUE(std::filesystem::exists(*result));

  EXPECT_NE(started.find("'in file.mp4'"), std::string::npos);
  ASSERT_GE(progress.size(), 2u);
  EXPECT_DOUBLE_EQ(progress.front(), 50.0);
  EXPECT_DOUBLE_EQ(progress.back(), 100.0);
}

TEST(SubprocessEncoderTest, FailureCarriesExitCodeAndOutputTail) {
  TempDir dir;
  SubprocessEncoder encoder(encoderConfig(installScript(dir, "ffmpeg", kFailingEncoder)));

  auto result = encoder.encode(EncodeRequest{.input_path = "in.mp4", .output_dir = dir.path() / "720p",
                                             .resolution = res720(), .source_duration = 0}, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("code: 1"), std::string::npos);
  EXPECT_NE(result.error().find("Conversion failed!"), std::string::npos);
  EXPECT_NE(result.error().find("noise 30"), std::string::npos);
  EXPECT_EQ(result.error().find("noise 5\n"), std::string::npos);
}

TEST(SubprocessEncoderTest, MissingPlaylistAfterSuccessIsAnError) {
  TempDir dir;
  SubprocessEncoder encoder(encoderConfig(installScript(dir, "ffmpeg", kSilentEncoder)));

  auto result = encoder.encode(EncodeRequest{.input_path = "in.mp4", .output_dir = dir.path() / "360p",
                                             .resolution = res360(), .source_duration = 0}, {});
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("missing"), std::string::npos);
}
