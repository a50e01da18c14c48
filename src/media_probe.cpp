/**
 * @file media_probe.cpp
 * @brief libavformat probing implementation
 */

#include "vedit/media_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include "vedit/logging.hpp"

namespace vedit {

std::optional<MediaInfo> probe_media(const std::string &path) {
  AVFormatContext *fmt_ctx = nullptr;
  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    char err_buf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(ret, err_buf, sizeof(err_buf));
    LOG_WARN("Cannot open '{}' for probing: {}", path, err_buf);
    return std::nullopt;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_WARN("Cannot find stream info in '{}'", path);
    avformat_close_input(&fmt_ctx);
    return std::nullopt;
  }

  MediaInfo info;
  info.duration = (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
                      ? fmt_ctx->duration / static_cast<double>(AV_TIME_BASE)
                      : 0.0;

  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVStream *stream = fmt_ctx->streams[i];
    const AVCodecParameters *par = stream->codecpar;

    if (par->codec_type == AVMEDIA_TYPE_VIDEO && !info.has_video) {
      info.has_video = true;
      info.width = par->width;
      info.height = par->height;
      if (stream->avg_frame_rate.den > 0 && stream->avg_frame_rate.num > 0)
        info.fps = av_q2d(stream->avg_frame_rate);
      else if (stream->r_frame_rate.den > 0 && stream->r_frame_rate.num > 0)
        info.fps = av_q2d(stream->r_frame_rate);
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      info.has_audio = true;
    }
  }

  avformat_close_input(&fmt_ctx);
  return info;
}

bool complete_asset_metadata(AssetInfo &asset) {
  bool missing = asset.duration <= 0.0 || !asset.has_audio.has_value() ||
                 (asset.type == AssetType::Video && asset.fps <= 0.0);
  if (!missing)
    return true;

  auto info = probe_media(asset.path);
  if (!info)
    return false;

  if (asset.duration <= 0.0)
    asset.duration = info->duration;
  if (asset.fps <= 0.0)
    asset.fps = info->fps;
  if (!asset.has_audio)
    asset.has_audio = info->has_audio;
  return true;
}

} // namespace vedit
