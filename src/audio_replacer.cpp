/**
 * @file audio_replacer.cpp
 * @brief Audio replacement implementation
 */

#include "clip_mix/audio_replacer.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"
#include "clip_mix/ffmpeg_commands.hpp"
#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

AudioReplacer::AudioReplacer(CommandRunner &runner, std::string ffmpeg_bin,
                             std::string audio_bitrate)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)),
      audio_bitrate_(std::move(audio_bitrate)) {}

std::string AudioReplacer::mux(const std::string &video_path,
                               const std::string &bgm_path,
                               double target_duration,
                               const std::string &output_path) {
  auto args = ffmpeg::mux_audio(ffmpeg_bin_, video_path, bgm_path,
                                target_duration, audio_bitrate_, output_path);

  TIMER_START(mux);
  CommandResult result = runner_.run(args);
  TIMER_END(mux);

  std::error_code ec;
  if (!result.launched) {
    fs::remove(output_path, ec);
    throw MuxFailed(fmt::format("could not launch {}", ffmpeg_bin_));
  }
  if (!result.ok()) {
    fs::remove(output_path, ec);
    throw MuxFailed(fmt::format("exit {}: {}", result.exit_code, result.tail()));
  }
  if (!fs::exists(output_path, ec)) {
    throw MuxFailed("ffmpeg reported success but wrote no output");
  }
  return output_path;
}

} // namespace clip_mix
