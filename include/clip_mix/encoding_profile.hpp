/**
 * @file encoding_profile.hpp
 * @brief Encoder capability probe and quality-profile resolution
 *
 * @details The quality table maps a profile name to knobs of each encoder
 *          family. NVENC CQ and x265 CRF are different scales, so a
 *          hardware-to-software fallback looks up the software row instead
 *          of copying the number.
 *
 *          | profile  | hevc_nvenc cq / preset | libx265 crf / preset |
 *          |----------|------------------------|----------------------|
 *          | visual   | 30 / p5                | 28 / medium          |
 *          | balanced | 32 / p6                | 30 / slow            |
 *          | size     | 34 / p7                | 32 / veryslow        |
 */

#ifndef CLIP_MIX_ENCODING_PROFILE_HPP
#define CLIP_MIX_ENCODING_PROFILE_HPP

#include <mutex>
#include <string>

#include "command_runner.hpp"
#include "types.hpp"

namespace clip_mix {

constexpr const char *HARDWARE_CODEC = "hevc_nvenc";
constexpr const char *SOFTWARE_CODEC = "libx265";

/**
 * @struct EncoderOverrides
 * @brief Per-run replacements for table values (0 / empty = table).
 * @note Each override only applies to its own family.
 */
struct EncoderOverrides {
  int nvenc_cq = 0;
  int x265_crf = 0;
  std::string preset_gpu;
  std::string preset_cpu;
};

/// Table row of the hardware family, overrides applied
EncodingProfile hardware_profile(QualityProfile quality,
                                 const EncoderOverrides &overrides);

/// Table row of the software family, overrides applied
EncodingProfile software_profile(QualityProfile quality,
                                 const EncoderOverrides &overrides);

/**
 * @class EncodingProfileResolver
 * @brief Resolves the run's EncodingProfile once and provides fallbacks.
 *
 * @note The encoder listing is fetched at most once (std::call_once); the
 *       result is read-only afterwards and shared by every worker.
 */
class EncodingProfileResolver {
public:
  EncodingProfileResolver(CommandRunner &runner, std::string ffmpeg_bin,
                          QualityProfile quality, EncoderOverrides overrides);

  /**
   * @brief Check that the ffmpeg executable can be launched.
   * @throws ExternalToolMissing
   */
  void ensure_tool();

  /// true if the ffmpeg build lists the hardware encoder
  bool hardware_available();

  /**
   * @brief Pick the run's encoding profile.
   * @param prefer_hardware Use the hardware encoder when available
   * @throws ExternalToolMissing if the encoder probe cannot launch ffmpeg
   */
  EncodingProfile resolve(bool prefer_hardware);

  /**
   * @brief Software equivalent of a profile with the same quality intent.
   * @note A software profile is returned unchanged.
   */
  EncodingProfile fallback(const EncodingProfile &profile) const;

private:
  void probe_encoders();

  CommandRunner &runner_;
  std::string ffmpeg_bin_;
  QualityProfile quality_;
  EncoderOverrides overrides_;

  std::once_flag probe_once_;
  bool hardware_ = false;
};

} // namespace clip_mix

#endif // CLIP_MIX_ENCODING_PROFILE_HPP
