#include "master_playlist.hpp"

#include <fstream>

namespace transcode_service {

std::string renderMasterPlaylist(const std::vector<Rendition>& renditions) {
  std::string out = "#EXTM3U\n";
  for (const auto& r : renditions) {
    out += "#EXT-X-STREAM-INF:BANDWIDTH=" + std::to_string(bandwidth(r.resolution)) +
           ",RESOLUTION=" + dimensions(r.resolution) + "\n";
    out += r.playlist + "\n";
  }
  return out;
}

std::expected<std::filesystem::path, std::string> writeMasterPlaylist(
    const std::filesystem::path& job_dir,
    const std::vector<Rendition>& renditions) {

  if (renditions.empty()) {
    return std::unexpected<std::string>("no renditions to reference");
  }

  const auto target = job_dir / "master.m3u8";
  const auto tmp = job_dir / "master.m3u8.tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return std::unexpected("Failed to open " + tmp.string());
    }
    out << renderMasterPlaylist(renditions);
    out.flush();
    if (!out) {
      return std::unexpected("Failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    auto reason = ec.message();
    std::filesystem::remove(tmp, ec);
    return std::unexpected("Failed to publish " + target.string() + ": " + reason);
  }
  return target;
}

} // namespace transcode_service
