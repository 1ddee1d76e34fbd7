/**
 * @file clip_transcoder.hpp
 * @brief One-shot normalization of a source clip into a cache segment
 */

#ifndef CLIP_MIX_CLIP_TRANSCODER_HPP
#define CLIP_MIX_CLIP_TRANSCODER_HPP

#include <string>

#include "command_runner.hpp"
#include "media_probe.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @struct ClampedTrim
 * @brief Trim window after clamping against the probed duration.
 */
struct ClampedTrim {
  double start = 0.0;  //< Seconds skipped at the head
  double length = 0.0; //< Seconds kept, 0 = until end of file
  bool clamped = false; //< true if the requested trim did not fit
};

/**
 * @brief Fit a TrimSpec inside a clip of known duration.
 *
 * @details head' = min(head, max(0, duration - MIN_KEPT_SECONDS))
 *
 *          tail' = min(tail, max(0, duration - head' - MIN_KEPT_SECONDS))
 *
 *          With an unknown duration (<= 0) only the head is applied.
 */
ClampedTrim clamp_trim(const TrimSpec &trim, double duration);

/**
 * @class ClipTranscoder
 * @brief Runs the trim + normalize + strip-audio transcode of one clip.
 *
 * @attention FAILURE MAPPING:
 *
 *   - Hardware profile fails -> HardwareEncoderUnavailable (caller may
 *     retry in software)
 *
 *   - Software profile fails -> SegmentBuildFailed
 */
class ClipTranscoder {
public:
  ClipTranscoder(CommandRunner &runner, MediaProber &prober,
                 std::string ffmpeg_bin);

  /**
   * @brief Transcode `asset` into `output_path`.
   * @throws HardwareEncoderUnavailable, SegmentBuildFailed
   */
  void transcode(const SourceAsset &asset, const TrimSpec &trim,
                 const NormalizationProfile &profile,
                 const EncodingProfile &encoding,
                 const std::string &output_path);

  /// Expected segment length in seconds, 0 when the duration is unknown
  double expected_length(const SourceAsset &asset, const TrimSpec &trim);

private:
  CommandRunner &runner_;
  MediaProber &prober_;
  std::string ffmpeg_bin_;
};

} // namespace clip_mix

#endif // CLIP_MIX_CLIP_TRANSCODER_HPP
