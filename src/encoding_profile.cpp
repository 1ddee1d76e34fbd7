/**
 * @file encoding_profile.cpp
 * @brief Encoder probe and quality table implementation
 */

#include "clip_mix/encoding_profile.hpp"

#include <sstream>
#include <utility>

#include "clip_mix/errors.hpp"
#include "clip_mix/ffmpeg_commands.hpp"
#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace {

struct QualityRow {
  QualityProfile quality;
  int nvenc_cq;
  const char *nvenc_preset;
  int x265_crf;
  const char *x265_preset;
};

const QualityRow QUALITY_TABLE[] = {
    {QualityProfile::Visual, 30, "p5", 28, "medium"},
    {QualityProfile::Balanced, 32, "p6", 30, "slow"},
    {QualityProfile::Size, 34, "p7", 32, "veryslow"},
};

const QualityRow &row_for(QualityProfile quality) {
  for (const auto &row : QUALITY_TABLE) {
    if (row.quality == quality)
      return row;
  }
  return QUALITY_TABLE[1];
}

/// Encoder listing lines look like " V....D hevc_nvenc   NVIDIA NVENC hevc"
bool lists_encoder(const std::string &listing, const std::string &name) {
  std::istringstream lines(listing);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string flags, encoder;
    if (fields >> flags >> encoder && encoder == name)
      return true;
  }
  return false;
}

} // anonymous namespace

EncodingProfile hardware_profile(QualityProfile quality,
                                 const EncoderOverrides &overrides) {
  const QualityRow &row = row_for(quality);
  EncodingProfile p;
  p.family = EncoderFamily::Hardware;
  p.quality = quality;
  p.codec = HARDWARE_CODEC;
  p.preset = overrides.preset_gpu.empty() ? row.nvenc_preset : overrides.preset_gpu;
  p.quality_value = overrides.nvenc_cq > 0 ? overrides.nvenc_cq : row.nvenc_cq;
  return p;
}

EncodingProfile software_profile(QualityProfile quality,
                                 const EncoderOverrides &overrides) {
  const QualityRow &row = row_for(quality);
  EncodingProfile p;
  p.family = EncoderFamily::Software;
  p.quality = quality;
  p.codec = SOFTWARE_CODEC;
  p.preset = overrides.preset_cpu.empty() ? row.x265_preset : overrides.preset_cpu;
  p.quality_value = overrides.x265_crf > 0 ? overrides.x265_crf : row.x265_crf;
  return p;
}

EncodingProfileResolver::EncodingProfileResolver(CommandRunner &runner,
                                                 std::string ffmpeg_bin,
                                                 QualityProfile quality,
                                                 EncoderOverrides overrides)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)), quality_(quality),
      overrides_(std::move(overrides)) {}

void EncodingProfileResolver::ensure_tool() {
  CommandResult result = runner_.run(ffmpeg::version(ffmpeg_bin_));
  if (!result.launched) {
    throw ExternalToolMissing(ffmpeg_bin_);
  }
  if (!result.ok()) {
    LOG_WARN("{} -version exited with {}", ffmpeg_bin_, result.exit_code);
  }
}

void EncodingProfileResolver::probe_encoders() {
  CommandResult result = runner_.run(ffmpeg::list_encoders(ffmpeg_bin_));
  if (!result.launched) {
    throw ExternalToolMissing(ffmpeg_bin_);
  }
  if (!result.ok()) {
    LOG_WARN("Encoder listing failed (exit {}), assuming no {}",
             result.exit_code, HARDWARE_CODEC);
    hardware_ = false;
    return;
  }
  hardware_ = lists_encoder(result.output, HARDWARE_CODEC);
}

bool EncodingProfileResolver::hardware_available() {
  std::call_once(probe_once_, &EncodingProfileResolver::probe_encoders, this);
  return hardware_;
}

EncodingProfile EncodingProfileResolver::resolve(bool prefer_hardware) {
  if (prefer_hardware) {
    if (hardware_available()) {
      return hardware_profile(quality_, overrides_);
    }
    LOG_WARN("{} not available, using {}", HARDWARE_CODEC, SOFTWARE_CODEC);
  }
  return software_profile(quality_, overrides_);
}

EncodingProfile
EncodingProfileResolver::fallback(const EncodingProfile &profile) const {
  if (!profile.is_hardware())
    return profile;
  return software_profile(profile.quality, overrides_);
}

} // namespace clip_mix
