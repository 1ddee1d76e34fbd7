/**
 * @file config.hpp
 * @brief Run configuration via environment variables and RunSettings
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          tuning parameters loaded from environment variables, and the
 *          RunSettings structure every front end hands to a MixRun.
 *          Paths (inputs, BGM, output) come from the command line; all
 *          other knobs come from the environment.
 */

#ifndef CLIP_MIX_CONFIG_HPP
#define CLIP_MIX_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_mix {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Raw value or default
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return val ? std::string(val) : std::string(default_val);
}

// **---- OUTPUT PLAN ----**

/// Number of output videos to produce
inline int outputs() {
  static int val = get_env_int("OUTPUTS", 1);
  return val;
}

/// Source clips concatenated into each output
inline int clips_per_output() {
  static int val = get_env_int("CLIPS_PER_OUTPUT", 5);
  return val;
}

/**
 * @brief Run-level random seed
 * @note 0 = derive a fresh seed from the clock for every run
 */
inline std::uint64_t run_seed() {
  static std::uint64_t val = static_cast<std::uint64_t>(
      std::strtoull(get_env_string("RUN_SEED", "0").c_str(), nullptr, 10));
  return val;
}

// **---- NORMALIZATION ----**

inline int target_width() {
  static int val = get_env_int("TARGET_WIDTH", 1080);
  return val;
}

inline int target_height() {
  static int val = get_env_int("TARGET_HEIGHT", 1920);
  return val;
}

inline int target_fps() {
  static int val = get_env_int("TARGET_FPS", 25);
  return val;
}

/// "pad" (letterbox on black) or "crop" (fill and centre-crop)
inline std::string fill_mode() {
  static std::string val = get_env_string("FILL_MODE", "pad");
  return val;
}

/// Seconds cut from the start of every clip
inline double trim_head() {
  static double val = get_env_double("TRIM_HEAD", 0.0);
  return val;
}

/// Seconds cut from the end of every clip
inline double trim_tail() {
  static double val = get_env_double("TRIM_TAIL", 1.0);
  return val;
}

// **---- ENCODING ----**

/**
 * @brief Prefer the NVENC encoder when the ffmpeg build has it
 * @note Falls back to libx265 per job if the hardware encoder fails
 */
inline bool use_gpu() {
  static bool val = (get_env_int("USE_GPU", 1) != 0);
  return val;
}

/// "visual", "balanced" or "size"
inline std::string quality_profile() {
  static std::string val = get_env_string("QUALITY_PROFILE", "balanced");
  return val;
}

/// NVENC CQ override (0 = use the quality profile table)
inline int nvenc_cq() {
  static int val = get_env_int("NVENC_CQ", 0);
  return val;
}

/// x265 CRF override (0 = use the quality profile table)
inline int x265_crf() {
  static int val = get_env_int("X265_CRF", 0);
  return val;
}

inline std::string preset_gpu() {
  static std::string val = get_env_string("PRESET_GPU", "");
  return val;
}

inline std::string preset_cpu() {
  static std::string val = get_env_string("PRESET_CPU", "");
  return val;
}

/// AAC bitrate of the replaced audio track
inline std::string audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "192k");
  return val;
}

// **---- PARALLEL PROCESSING ----**

/**
 * @brief Number of output jobs processed simultaneously
 * @note 0 = auto-detect from the cgroup-aware CPU limit.
 *       Never more workers than jobs, never fewer than one.
 */
inline int parallel_jobs() {
  static int val = get_env_int("PARALLEL_JOBS", 4);
  return val;
}

// **---- GROUPING ----**

/**
 * @brief Partition inputs by native resolution before selection
 * @note A group needs more than GROUP_MIN_SIZE videos; with no qualifying
 *       group the run falls back to ungrouped selection.
 */
inline bool group_by_resolution() {
  static bool val = (get_env_int("GROUP_BY_RESOLUTION", 0) != 0);
  return val;
}

inline int group_min_size() {
  static int val = get_env_int("GROUP_MIN_SIZE", 20);
  return val;
}

// **---- LOCATIONS ----**

/// Cache directory (empty = "<first input dir>_ts_cache")
inline std::string cache_dir() {
  static std::string val = get_env_string("CACHE_DIR", "");
  return val;
}

/// Scratch directory (empty = "<output dir>/_work")
inline std::string work_dir() {
  static std::string val = get_env_string("WORK_DIR", "");
  return val;
}

/// ffmpeg executable, resolved through PATH when not absolute
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

} // namespace Config

// **---- RUN SETTINGS ----**

/**
 * @struct RunSettings
 * @brief The complete configuration surface of one mix run.
 */
struct RunSettings {
  std::vector<std::string> video_dirs;
  std::string bgm_path;
  std::string output; //< File (*.mp4) or directory; empty = default

  int outputs = 1;
  int clips_per_output = 5;
  int workers = 4; //< 0 = auto
  std::uint64_t run_seed = 0;

  NormalizationProfile profile;
  TrimSpec trim{0.0, 1.0};

  bool prefer_hardware = true;
  QualityProfile quality = QualityProfile::Balanced;
  int nvenc_cq_override = 0;
  int x265_crf_override = 0;
  std::string preset_gpu_override;
  std::string preset_cpu_override;
  std::string audio_bitrate = "192k";

  bool group_by_resolution = false;
  int group_min_size = 20;

  std::string cache_dir; //< empty = derived
  std::string work_dir;  //< empty = derived
  std::string ffmpeg_bin = "ffmpeg";

  /**
   * @brief Build settings from the Config:: environment accessors.
   * @throws InvalidSettings if FILL_MODE or QUALITY_PROFILE is unknown
   */
  static RunSettings from_env(std::vector<std::string> video_dirs,
                              std::string bgm_path, std::string output);

  /// Directory that receives the final videos
  std::string output_dir() const;

  /// Final path of output number `index` (1-based)
  std::string output_path_for(int index) const;

  std::string resolved_cache_dir() const;
  std::string resolved_work_dir() const;
};

/**
 * @brief Reject settings no run could succeed with.
 * @throws InvalidSettings describing the first problem found
 */
void validate_settings(const RunSettings &settings);

} // namespace clip_mix

#endif // CLIP_MIX_CONFIG_HPP
