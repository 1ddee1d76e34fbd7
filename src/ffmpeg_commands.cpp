/**
 * @file ffmpeg_commands.cpp
 * @brief ffmpeg argument list builders
 */

#include "clip_mix/ffmpeg_commands.hpp"

#include <fmt/core.h>

namespace clip_mix {
namespace ffmpeg {

namespace {

/// Flags shared by every processing command
Args base(const std::string &bin) {
  return {bin, "-hide_banner", "-loglevel", "error", "-y"};
}

std::string seconds_arg(double seconds) { return fmt::format("{:.3f}", seconds); }

} // anonymous namespace

Args version(const std::string &bin) { return {bin, "-hide_banner", "-version"}; }

Args list_encoders(const std::string &bin) {
  return {bin, "-hide_banner", "-encoders"};
}

std::string video_filter(const NormalizationProfile &p) {
  std::string chain;
  if (p.fill_mode == FillMode::Crop) {
    chain = fmt::format("scale={0}:{1}:force_original_aspect_ratio=increase:"
                        "flags=lanczos,crop={0}:{1}",
                        p.width, p.height);
  } else {
    chain = fmt::format("scale={0}:{1}:force_original_aspect_ratio=decrease:"
                        "flags=lanczos,pad={0}:{1}:(ow-iw)/2:(oh-ih)/2:black",
                        p.width, p.height);
  }
  chain += fmt::format(",setsar=1,fps={},format={},setpts=PTS-STARTPTS", p.fps,
                       p.pixel_format);
  return chain;
}

Args encoder_args(const EncodingProfile &e) {
  if (e.is_hardware()) {
    return {"-c:v",  e.codec, "-preset", e.preset, "-rc", "vbr",
            "-cq",   std::to_string(e.quality_value), "-b:v", "0"};
  }
  return {"-c:v",   e.codec,  "-crf",          std::to_string(e.quality_value),
          "-preset", e.preset, "-x265-params", "log-level=error"};
}

Args transcode(const std::string &bin, const std::string &source, double start,
               double length, const NormalizationProfile &profile,
               const EncodingProfile &encoding, const std::string &output) {
  Args args = base(bin);
  /// Regenerate missing timestamps before seeking
  args.insert(args.end(), {"-fflags", "+genpts"});
  if (start > 0.0) {
    args.insert(args.end(), {"-ss", seconds_arg(start)});
  }
  args.insert(args.end(), {"-i", source});
  if (length > 0.0) {
    args.insert(args.end(), {"-t", seconds_arg(length)});
  }
  args.insert(args.end(), {"-an", "-sn", "-dn", "-vf", video_filter(profile),
                           "-r", std::to_string(profile.fps), "-fps_mode",
                           "cfr"});
  Args enc = encoder_args(encoding);
  args.insert(args.end(), enc.begin(), enc.end());
  args.insert(args.end(),
              {"-avoid_negative_ts", "make_zero", "-f", "mpegts", output});
  return args;
}

Args concat(const std::string &bin, const std::string &list_path,
            const std::string &output) {
  Args args = base(bin);
  args.insert(args.end(),
              {"-f", "concat", "-safe", "0", "-protocol_whitelist",
               "file,pipe,fd", "-i", list_path, "-c", "copy", "-an",
               "-fflags", "+genpts", "-avoid_negative_ts", "make_zero",
               "-tag:v", "hvc1", "-movflags", "+faststart", output});
  return args;
}

Args mux_audio(const std::string &bin, const std::string &video,
               const std::string &bgm, double target_duration,
               const std::string &audio_bitrate, const std::string &output) {
  Args args = base(bin);
  /// Loop the music forever and cut it at the target length
  args.insert(args.end(), {"-i", video, "-stream_loop", "-1", "-i", bgm,
                           "-map", "0:v:0", "-map", "1:a:0", "-c:v", "copy",
                           "-c:a", "aac", "-b:a", audio_bitrate, "-ar",
                           std::to_string(OUTPUT_AUDIO_RATE), "-ac",
                           std::to_string(OUTPUT_AUDIO_CHANNELS)});
  if (target_duration > 0.0) {
    args.insert(args.end(), {"-t", seconds_arg(target_duration)});
  } else {
    args.push_back("-shortest");
  }
  args.insert(args.end(), {"-movflags", "+faststart", output});
  return args;
}

} // namespace ffmpeg
} // namespace clip_mix
