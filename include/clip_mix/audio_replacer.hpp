/**
 * @file audio_replacer.hpp
 * @brief Background music replacement of a silent video
 */

#ifndef CLIP_MIX_AUDIO_REPLACER_HPP
#define CLIP_MIX_AUDIO_REPLACER_HPP

#include <string>

#include "command_runner.hpp"

namespace clip_mix {

/**
 * @class AudioReplacer
 * @brief Muxes a BGM track onto a video, looped or cut to the video length.
 *
 * @note The BGM is always re-encoded to AAC at the configured bitrate,
 *       44.1 kHz stereo, whatever its source format. The video stream is
 *       copied.
 */
class AudioReplacer {
public:
  AudioReplacer(CommandRunner &runner, std::string ffmpeg_bin,
                std::string audio_bitrate);

  /**
   * @brief Write `output_path` with the video of `video_path` and the
   *        looped/truncated audio of `bgm_path`.
   *
   * @param target_duration Seconds of audio to produce; <= 0 ends the audio
   *        with the video stream
   * @return output_path
   * @throws MuxFailed on any ffmpeg failure (no partial output is left)
   */
  std::string mux(const std::string &video_path, const std::string &bgm_path,
                  double target_duration, const std::string &output_path);

private:
  CommandRunner &runner_;
  std::string ffmpeg_bin_;
  std::string audio_bitrate_;
};

} // namespace clip_mix

#endif // CLIP_MIX_AUDIO_REPLACER_HPP
