#include "av_media_probe.hpp"

#include <memory>

namespace transcode_service {

namespace {

struct InputCloser {
  void operator()(AVFormatContext* ctx) const {
    avformat_close_input(&ctx);
  }
};

using InputContext = std::unique_ptr<AVFormatContext, InputCloser>;

std::string avError(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

} // namespace

AvMediaProbe::AvMediaProbe(int loglevel) {
  av_log_set_level(loglevel);
}

std::expected<MediaInfo, std::string> AvMediaProbe::probe(const std::string& path) {
  AVFormatContext* raw = nullptr;
  if (int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected("Could not open input file " + path + ": " + avError(ret));
  }
  InputContext input(raw);

  if (int ret = avformat_find_stream_info(input.get(), nullptr); ret < 0) {
    return std::unexpected("Could not find stream info in " + path + ": " + avError(ret));
  }

  int video_idx = av_find_best_stream(input.get(), AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    return std::unexpected("Could not find video stream in " + path);
  }
  const AVStream* stream = input->streams[video_idx];

  MediaInfo info;
  info.width = stream->codecpar->width;
  info.height = stream->codecpar->height;
  info.video_codec = avcodec_get_name(stream->codecpar->codec_id);
  info.container = input->iformat && input->iformat->name ? input->iformat->name : "";

  if (input->duration != AV_NOPTS_VALUE && input->duration > 0) {
    info.duration_seconds = static_cast<double>(input->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
    info.duration_seconds = stream->duration * av_q2d(stream->time_base);
  }

  return info;
}

} // namespace transcode_service
