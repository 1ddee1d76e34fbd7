/**
 * @file config.cpp
 * @brief RunSettings construction, validation and derived paths
 */

#include "clip_mix/config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool is_mp4_file_spec(const std::string &output) {
  return !output.empty() && lower(fs::path(output).extension().string()) == ".mp4";
}

/// "/videos/" and "/videos" both yield "/videos"
fs::path without_trailing_slash(const std::string &dir) {
  fs::path p(dir);
  if (p.filename().empty())
    p = p.parent_path();
  return p;
}

} // anonymous namespace

RunSettings RunSettings::from_env(std::vector<std::string> video_dirs,
                                  std::string bgm_path, std::string output) {
  RunSettings s;
  s.video_dirs = std::move(video_dirs);
  s.bgm_path = std::move(bgm_path);
  s.output = std::move(output);

  s.outputs = Config::outputs();
  s.clips_per_output = Config::clips_per_output();
  s.workers = Config::parallel_jobs();
  s.run_seed = Config::run_seed();

  s.profile.width = Config::target_width();
  s.profile.height = Config::target_height();
  s.profile.fps = Config::target_fps();
  if (!parse_fill_mode(Config::fill_mode(), s.profile.fill_mode)) {
    throw InvalidSettings(
        fmt::format("FILL_MODE must be pad or crop, got '{}'", Config::fill_mode()));
  }
  s.trim = TrimSpec{Config::trim_head(), Config::trim_tail()};

  s.prefer_hardware = Config::use_gpu();
  if (!parse_quality_profile(Config::quality_profile(), s.quality)) {
    throw InvalidSettings(
        fmt::format("QUALITY_PROFILE must be visual, balanced or size, got '{}'",
                    Config::quality_profile()));
  }
  s.nvenc_cq_override = Config::nvenc_cq();
  s.x265_crf_override = Config::x265_crf();
  s.preset_gpu_override = Config::preset_gpu();
  s.preset_cpu_override = Config::preset_cpu();
  s.audio_bitrate = Config::audio_bitrate();

  s.group_by_resolution = Config::group_by_resolution();
  s.group_min_size = Config::group_min_size();

  s.cache_dir = Config::cache_dir();
  s.work_dir = Config::work_dir();
  s.ffmpeg_bin = Config::ffmpeg_bin();
  return s;
}

std::string RunSettings::output_dir() const {
  if (output.empty()) {
    fs::path first = without_trailing_slash(video_dirs.front());
    std::string suffix =
        video_dirs.size() > 1 ? "_longvideo_combined" : "_longvideo";
    return (first.parent_path() / (first.filename().string() + suffix))
        .string();
  }
  if (is_mp4_file_spec(output)) {
    fs::path parent = fs::path(output).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
  }
  return output;
}

std::string RunSettings::output_path_for(int index) const {
  if (is_mp4_file_spec(output)) {
    fs::path spec(output);
    return (fs::path(output_dir()) /
            fmt::format("{}_{}{}", spec.stem().string(), index,
                        spec.extension().string()))
        .string();
  }
  return (fs::path(output_dir()) /
          fmt::format("mix_{}clips_{}.mp4", clips_per_output, index))
      .string();
}

std::string RunSettings::resolved_cache_dir() const {
  if (!cache_dir.empty())
    return cache_dir;
  fs::path first = without_trailing_slash(video_dirs.front());
  return (first.parent_path() / (first.filename().string() + "_ts_cache"))
      .string();
}

std::string RunSettings::resolved_work_dir() const {
  if (!work_dir.empty())
    return work_dir;
  return (fs::path(output_dir()) / "_work").string();
}

void validate_settings(const RunSettings &s) {
  if (s.video_dirs.empty())
    throw InvalidSettings("at least one input video directory is required");

  for (const auto &dir : s.video_dirs) {
    if (!fs::is_directory(dir))
      throw InvalidSettings(fmt::format("not a directory: {}", dir));
  }
  if (s.bgm_path.empty() || !fs::exists(s.bgm_path))
    throw InvalidSettings(fmt::format("BGM path does not exist: {}", s.bgm_path));

  if (s.outputs < 1)
    throw InvalidSettings("OUTPUTS must be at least 1");
  if (s.clips_per_output < 1)
    throw InvalidSettings("CLIPS_PER_OUTPUT must be at least 1");
  if (s.workers < 0)
    throw InvalidSettings("PARALLEL_JOBS must not be negative");
  if (s.profile.width <= 0 || s.profile.height <= 0)
    throw InvalidSettings("TARGET_WIDTH/TARGET_HEIGHT must be positive");
  if (s.profile.fps <= 0)
    throw InvalidSettings("TARGET_FPS must be positive");
  if (s.trim.head_seconds < 0.0 || s.trim.tail_seconds < 0.0)
    throw InvalidSettings("TRIM_HEAD/TRIM_TAIL must not be negative");
  if (s.group_min_size < 0)
    throw InvalidSettings("GROUP_MIN_SIZE must not be negative");

  if (is_mp4_file_spec(s.output) && s.video_dirs.size() > 1) {
    throw InvalidSettings(
        "an output directory is required when several input directories are used");
  }
}

} // namespace clip_mix
