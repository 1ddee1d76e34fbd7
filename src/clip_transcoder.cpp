/**
 * @file clip_transcoder.cpp
 * @brief Clip transcode implementation
 */

#include "clip_mix/clip_transcoder.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"
#include "clip_mix/ffmpeg_commands.hpp"
#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

ClampedTrim clamp_trim(const TrimSpec &trim, double duration) {
  ClampedTrim out;
  if (duration <= 0.0) {
    out.start = trim.head_seconds;
    return out;
  }

  double head = std::min(trim.head_seconds,
                         std::max(0.0, duration - MIN_KEPT_SECONDS));
  double tail = std::min(trim.tail_seconds,
                         std::max(0.0, duration - head - MIN_KEPT_SECONDS));

  out.start = head;
  out.length = std::max(0.0, duration - head - tail);
  out.clamped = (head != trim.head_seconds || tail != trim.tail_seconds);
  return out;
}

ClipTranscoder::ClipTranscoder(CommandRunner &runner, MediaProber &prober,
                               std::string ffmpeg_bin)
    : runner_(runner), prober_(prober), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

double ClipTranscoder::expected_length(const SourceAsset &asset,
                                       const TrimSpec &trim) {
  MediaInfo info;
  if (!prober_.probe(asset.path, info) || info.duration <= 0.0)
    return 0.0;
  return clamp_trim(trim, info.duration).length;
}

void ClipTranscoder::transcode(const SourceAsset &asset, const TrimSpec &trim,
                               const NormalizationProfile &profile,
                               const EncodingProfile &encoding,
                               const std::string &output_path) {
  MediaInfo info;
  if (!prober_.probe(asset.path, info) || info.duration <= 0.0) {
    LOG_WARN("Duration unknown for {}, applying head trim only", asset.stem);
  }

  ClampedTrim window = clamp_trim(trim, info.duration);
  if (window.clamped) {
    LOG_WARN("Trim {} clamped for {} ({:.2f}s long): keeping {:.2f}s from {:.2f}s",
             trim.canonical(), asset.stem, info.duration, window.length,
             window.start);
  }

  auto args = ffmpeg::transcode(ffmpeg_bin_, asset.path, window.start,
                                window.length, profile, encoding, output_path);

  TIMER_START(transcode);
  CommandResult result = runner_.run(args);
  TIMER_END(transcode);

  if (!result.launched) {
    throw SegmentBuildFailed(asset.path,
                             fmt::format("could not launch {}", ffmpeg_bin_));
  }
  if (!result.ok()) {
    std::string cause = fmt::format("{} exited with {}: {}", encoding.codec,
                                    result.exit_code, result.tail());
    if (encoding.is_hardware()) {
      throw HardwareEncoderUnavailable(cause);
    }
    throw SegmentBuildFailed(asset.path, cause);
  }

  std::error_code ec;
  auto size = fs::file_size(output_path, ec);
  if (ec || size == 0) {
    throw SegmentBuildFailed(asset.path, "transcoder produced no output");
  }
}

} // namespace clip_mix
