/**
 * @file media_probe.cpp
 * @brief libavformat-backed media probing implementation
 *
 * @details Opens the container, reads stream info and extracts:
 *
 *          - width/height of the best video stream
 *
 *          - frame rate (guessed from the stream and container)
 *
 *          - container duration in seconds
 */

#include "clip_mix/media_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
#include <libavutil/rational.h>
}

#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace {

/// RAII owner of an opened input context
class InputContext {
public:
  InputContext() = default;
  ~InputContext() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  InputContext(const InputContext &) = delete;
  InputContext &operator=(const InputContext &) = delete;

  AVFormatContext **addr() { return &ctx_; }
  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

} // anonymous namespace

// **---- LibavMediaProber ----**

LibavMediaProber::LibavMediaProber() {
  /// Probing noise would interleave with job logs
  av_log_set_level(AV_LOG_ERROR);
}

bool LibavMediaProber::probe(const std::string &path, MediaInfo &info) {
  InputContext input;

  if (avformat_open_input(input.addr(), path.c_str(), nullptr, nullptr) < 0) {
    LOG_WARN("avformat_open_input failed: {}", path);
    return false;
  }

  /// Find stream info (reads some packets to determine streams)
  if (avformat_find_stream_info(input.get(), nullptr) < 0) {
    LOG_WARN("avformat_find_stream_info failed: {}", path);
    return false;
  }

  AVFormatContext *fmt_ctx = input.get();
  MediaInfo probed;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    probed.duration = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }

  int video_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx >= 0) {
    AVStream *stream = fmt_ctx->streams[video_stream_idx];
    probed.width = stream->codecpar->width;
    probed.height = stream->codecpar->height;

    AVRational rate = av_guess_frame_rate(fmt_ctx, stream, nullptr);
    if (rate.num > 0 && rate.den > 0) {
      probed.fps = av_q2d(rate);
    }

    /// Containers without a global duration still carry one per stream
    if (probed.duration <= 0.0 && stream->duration != AV_NOPTS_VALUE) {
      probed.duration = stream->duration * av_q2d(stream->time_base);
    }
  } else {
    int audio_stream_idx =
        av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_stream_idx < 0) {
      LOG_WARN("No audio or video stream found: {}", path);
      return false;
    }
  }

  info = probed;
  return true;
}

// **---- CachingProber ----**

bool CachingProber::probe(const std::string &path, MediaInfo &info) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = memo_.find(path);
    if (it != memo_.end()) {
      info = it->second.info;
      return it->second.ok;
    }
  }

  /// Two workers may probe the same file at once; both results are equal
  MediaInfo probed;
  bool ok = inner_.probe(path, probed);

  std::lock_guard<std::mutex> lock(mutex_);
  auto inserted = memo_.emplace(path, Memo{ok, probed});
  info = inserted.first->second.info;
  return inserted.first->second.ok;
}

} // namespace clip_mix
