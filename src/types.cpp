/**
 * @file types.cpp
 * @brief Canonical encodings and name tables for core types
 */

#include "clip_mix/types.hpp"

#include <cmath>

#include <fmt/core.h>

#include "clip_mix/system.hpp"

namespace clip_mix {

// **---- TrimSpec ----**

std::string canonical_seconds(double seconds) {
  /// Only exact whole seconds drop the decimal: 2.96 is "3.0", not "3"
  if (seconds == std::floor(seconds)) {
    return fmt::format("{:.0f}", seconds);
  }
  return fmt::format("{:.1f}", seconds);
}

std::string TrimSpec::canonical() const {
  return fmt::format("h{}_t{}", canonical_seconds(head_seconds),
                     canonical_seconds(tail_seconds));
}

bool operator==(const TrimSpec &a, const TrimSpec &b) {
  return a.canonical() == b.canonical();
}

bool operator!=(const TrimSpec &a, const TrimSpec &b) { return !(a == b); }

// **---- NormalizationProfile ----**

const char *to_string(FillMode mode) {
  return mode == FillMode::Crop ? "crop" : "pad";
}

bool parse_fill_mode(const std::string &text, FillMode &mode) {
  if (text == "pad") {
    mode = FillMode::Pad;
    return true;
  }
  if (text == "crop") {
    mode = FillMode::Crop;
    return true;
  }
  return false;
}

std::string NormalizationProfile::tag() const {
  return fmt::format("{}x{}_{}fps_{}", width, height, fps, to_string(fill_mode));
}

bool operator==(const NormalizationProfile &a, const NormalizationProfile &b) {
  return a.width == b.width && a.height == b.height && a.fps == b.fps &&
         a.fill_mode == b.fill_mode && a.pixel_format == b.pixel_format;
}

bool operator!=(const NormalizationProfile &a, const NormalizationProfile &b) {
  return !(a == b);
}

// **---- SourceAsset ----**

std::string SourceAsset::signature() const {
  return short_hash(fmt::format("{}:{}", size_bytes, mtime_ns));
}

// **---- Name tables ----**

const char *to_string(EncoderFamily family) {
  return family == EncoderFamily::Hardware ? "hardware" : "software";
}

const char *to_string(QualityProfile quality) {
  switch (quality) {
  case QualityProfile::Visual:
    return "visual";
  case QualityProfile::Size:
    return "size";
  case QualityProfile::Balanced:
    break;
  }
  return "balanced";
}

bool parse_quality_profile(const std::string &text, QualityProfile &quality) {
  if (text == "visual") {
    quality = QualityProfile::Visual;
  } else if (text == "balanced") {
    quality = QualityProfile::Balanced;
  } else if (text == "size") {
    quality = QualityProfile::Size;
  } else {
    return false;
  }
  return true;
}

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Succeeded:
    return "succeeded";
  case JobStatus::Cancelled:
    return "cancelled";
  case JobStatus::Failed:
    break;
  }
  return "failed";
}

} // namespace clip_mix
