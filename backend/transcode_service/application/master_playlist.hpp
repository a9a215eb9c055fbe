#pragma once

#include "domain/task.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace transcode_service {

// A finished rendition, relative to the job directory
struct Rendition {
  Resolution resolution;
  std::string playlist;   // "720p/index.m3u8"
};

// #EXTM3U
// #EXT-X-STREAM-INF:BANDWIDTH=<bps>,RESOLUTION=<w>x<h>
// <playlist>
std::string renderMasterPlaylist(const std::vector<Rendition>& renditions);

// Writes through a temporary sibling and renames it, so a reader never sees a partial file
std::expected<std::filesystem::path, std::string> writeMasterPlaylist(
  const std::filesystem::path& job_dir,
  const std::vector<Rendition>& renditions
);

} // namespace transcode_service
