#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "domain/task.hpp"

using namespace transcode_service;

TEST(ResolutionTest, DerivedStrings) {
  Resolution r{.width = 1280, .height = 720, .bitrate = 2500, .fps = 30};
  EXPECT_EQ(label(r), "720p");
  EXPECT_EQ(dimensions(r), "1280x720");
  EXPECT_EQ(bandwidth(r), 2500000);
}

TEST(ResolutionTest, AcceptsNumericStringsWithKiloSuffix) {
  auto j = nlohmann::json::parse(R"({"width":"640","height":360,"bitrate":"800k","fps":"25"})");
  auto r = j.get<Resolution>();
  EXPECT_EQ(r.width, 640);
  EXPECT_EQ(r.height, 360);
  EXPECT_EQ(r.bitrate, 800);
  EXPECT_DOUBLE_EQ(r.fps, 25.0);
}

TEST(ResolutionTest, KeepsFractionalFrameRateFromNumber) {
  auto r = nlohmann::json::parse(R"({"width":1280,"height":720,"bitrate":2500,"fps":29.97})").get<Resolution>();
  EXPECT_DOUBLE_EQ(r.fps, 29.97);
  EXPECT_EQ(frameRate(r), "29.97");
}

TEST(ResolutionTest, KeepsFractionalFrameRateFromString) {
  auto r = nlohmann::json::parse(R"({"width":1280,"height":720,"bitrate":"2500k","fps":"29.97"})").get<Resolution>();
  EXPECT_DOUBLE_EQ(r.fps, 29.97);
  EXPECT_EQ(frameRate(r), "29.97");
}

TEST(ResolutionTest, WholeFrameRatesPrintWithoutDecimals) {
  Resolution r{.width = 640, .height = 360, .bitrate = 800, .fps = 30};
  EXPECT_EQ(frameRate(r), "30");
  r.fps = 23.976;
  EXPECT_EQ(frameRate(r), "23.976");
}

TEST(ResolutionTest, RejectsMissingOrNonPositiveFields) {
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"width":640,"height":360,"fps":30})").get<Resolution>());
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"width":640,"height":360,"bitrate":"fast","fps":30})").get<Resolution>());
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"width":0,"height":360,"bitrate":800,"fps":30})").get<Resolution>());
  EXPECT_ANY_THROW(nlohmann::json::parse(R"({"width":640,"height":360,"bitrate":800,"fps":"nan"})").get<Resolution>());
}

TEST(ResolutionTest, FindsRepeatedLabels) {
  Resolution r360{.width = 640, .height = 360, .bitrate = 800, .fps = 30};
  Resolution r720{.width = 1280, .height = 720, .bitrate = 2500, .fps = 30};
  Resolution wide720{.width = 1920, .height = 720, .bitrate = 4000, .fps = 30};
  EXPECT_EQ(duplicateLabel({r360, r720}), "");
  EXPECT_EQ(duplicateLabel({}), "");
  EXPECT_EQ(duplicateLabel({r720, r360, wide720}), "720p");
}

TEST(TaskStatusTest, WireNames) {
  EXPECT_STREQ(toString(TaskStatus::Processing), "Processing");
  EXPECT_STREQ(toString(TaskStatus::Completed), "Completed");
  EXPECT_STREQ(toString(TaskStatus::Error), "Error");
}
