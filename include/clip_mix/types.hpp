/**
 * @file types.hpp
 * @brief Core data types shared by every stage of a mix run
 *
 * @details Contains the value types that flow through the pipeline:
 *          - TrimSpec and its canonical cache-key encoding
 *
 *          - NormalizationProfile (one per run)
 *
 *          - SourceAsset, CacheEntry, SegmentSelection
 *
 *          - EncodingProfile and quality profile names
 *
 *          - OutputJob and JobResult
 */

#ifndef CLIP_MIX_TYPES_HPP
#define CLIP_MIX_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace clip_mix {

// **----- CONSTANTS -----**

/// Shortest clip the transcoder will produce after trim clamping
constexpr double MIN_KEPT_SECONDS = 0.5;

/// Audio sample rate and channel count of every muxed output
constexpr int OUTPUT_AUDIO_RATE = 44100;
constexpr int OUTPUT_AUDIO_CHANNELS = 2;

// **----- TRIM -----**

/**
 * @struct TrimSpec
 * @brief Seconds to cut from the head and tail of one source clip.
 * @note Equality is decided on the canonical text form, so two specs that
 *       encode to the same cache key compare equal.
 */
struct TrimSpec {
  double head_seconds = 0.0; //< Cut from the start (>= 0)
  double tail_seconds = 0.0; //< Cut from the end (>= 0)

  /**
   * @brief Canonical encoding used as a cache-key component.
   * @return "h<head>_t<tail>" with integers rendered without decimals and
   *         everything else rounded to one decimal place
   */
  std::string canonical() const;
};

bool operator==(const TrimSpec &a, const TrimSpec &b);
bool operator!=(const TrimSpec &a, const TrimSpec &b);

/// Render one trim value canonically ("1", "0.5", "2.3")
std::string canonical_seconds(double seconds);

// **----- NORMALIZATION -----**

enum class FillMode { Pad, Crop };

const char *to_string(FillMode mode);
bool parse_fill_mode(const std::string &text, FillMode &mode);

/**
 * @struct NormalizationProfile
 * @brief Geometry and timing every cached segment of a run is built to.
 */
struct NormalizationProfile {
  int width = 1080;
  int height = 1920;
  int fps = 25;
  FillMode fill_mode = FillMode::Pad;
  std::string pixel_format = "yuv420p";

  /// Short tag embedded in cache file names, e.g. "1080x1920_25fps_pad"
  std::string tag() const;
};

bool operator==(const NormalizationProfile &a, const NormalizationProfile &b);
bool operator!=(const NormalizationProfile &a, const NormalizationProfile &b);

// **----- ASSETS -----**

/**
 * @struct SourceAsset
 * @brief One enumerated input file.
 * @note Identity is the absolute path plus the modification signature.
 *       Media attributes are probed lazily through a CachingProber.
 */
struct SourceAsset {
  std::string path;         //< Absolute path
  std::string stem;         //< File name without extension
  std::string extension;    //< Lower-case extension including the dot
  std::uintmax_t size_bytes = 0;
  std::int64_t mtime_ns = 0; //< Last modification time

  /// Hex digest of (size, mtime) used to detect a changed source
  std::string signature() const;
};

/**
 * @struct MediaInfo
 * @brief Probed stream attributes of a media file.
 */
struct MediaInfo {
  int width = 0;
  int height = 0;
  double fps = 0.0;
  double duration = 0.0; //< Seconds, 0 when unknown
};

// **----- CACHE -----**

/**
 * @struct CacheEntry
 * @brief A normalized, audio-free intermediate segment on disk.
 */
struct CacheEntry {
  std::string path;
  std::string source_path;
  TrimSpec trim;
  NormalizationProfile profile;
  bool from_cache = false; //< true when served without a transcode
};

/**
 * @struct SegmentChoice
 * @brief One slot of a SegmentSelection.
 */
struct SegmentChoice {
  SourceAsset asset;
  TrimSpec trim;
};

using SegmentSelection = std::vector<SegmentChoice>;

// **----- ENCODING -----**

enum class EncoderFamily { Hardware, Software };

const char *to_string(EncoderFamily family);

enum class QualityProfile { Visual, Balanced, Size };

const char *to_string(QualityProfile quality);
bool parse_quality_profile(const std::string &text, QualityProfile &quality);

/**
 * @struct EncodingProfile
 * @brief Resolved encoder family and its rate-control knobs.
 * @note For hardware profiles quality_value is an NVENC CQ; for software
 *       profiles it is an x265 CRF. The two scales are not interchangeable.
 */
struct EncodingProfile {
  EncoderFamily family = EncoderFamily::Software;
  QualityProfile quality = QualityProfile::Balanced;
  std::string codec;    //< "hevc_nvenc" or "libx265"
  std::string preset;   //< "p6", "slow", ...
  int quality_value = 0; //< CQ or CRF

  bool is_hardware() const { return family == EncoderFamily::Hardware; }
};

// **----- JOBS -----**

/**
 * @struct OutputJob
 * @brief One requested output video.
 */
struct OutputJob {
  int index = 0; //< 1-based job index
  std::uint64_t seed = 0;
  SegmentSelection selection;
  std::string bgm_path;
  std::string output_path;
  std::string group_label; //< "1920x1080" in grouped mode, empty otherwise
};

enum class JobStatus { Succeeded, Failed, Cancelled };

const char *to_string(JobStatus status);

/**
 * @struct CompressionStats
 * @brief Input vs. output size of a finished job.
 * @note known is false when a size could not be read.
 */
struct CompressionStats {
  bool known = false;
  std::uintmax_t input_bytes = 0;
  std::uintmax_t output_bytes = 0;
  double ratio = 0.0; //< output / input
};

/**
 * @struct JobResult
 * @brief Terminal state of one OutputJob.
 */
struct JobResult {
  int index = 0;
  JobStatus status = JobStatus::Failed;
  std::string output_path; //< Set on success
  std::string stage;       //< Failing stage on failure
  std::string message;     //< Failure reason
  bool used_fallback = false;
  std::vector<std::string> sources; //< Selected source paths, in order
  CompressionStats compression;
  long processing_time_us = 0;

  bool ok() const { return status == JobStatus::Succeeded; }
};

} // namespace clip_mix

#endif // CLIP_MIX_TYPES_HPP
