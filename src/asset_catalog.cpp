/**
 * @file asset_catalog.cpp
 * @brief Recursive input scanning and resolution grouping
 */

#include "clip_mix/asset_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <utility>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"
#include "clip_mix/logging.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

const std::set<std::string> VIDEO_EXTS = {".mp4", ".mov", ".mkv", ".avi",
                                          ".webm", ".flv", ".m4v", ".ts"};
const std::set<std::string> AUDIO_EXTS = {".mp3", ".wav", ".m4a",
                                          ".aac", ".flac", ".ogg"};

std::string lower_extension(const fs::path &p) {
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

/// Sorted regular files below `dir` accepted by `keep`
template <typename Pred>
std::vector<std::string> collect_files(const std::string &dir, Pred keep) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG_WARN("Cannot scan {}: {}", dir, ec.message());
    return files;
  }
  for (const auto &entry : it) {
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec) && keep(entry.path().string())) {
      files.push_back(fs::absolute(entry.path()).lexically_normal().string());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

} // anonymous namespace

std::string ResolutionGroup::label() const {
  return fmt::format("{}x{}", width, height);
}

AssetCatalog::AssetCatalog(std::vector<SourceAsset> videos,
                           std::vector<std::string> bgm)
    : videos_(std::move(videos)), bgm_(std::move(bgm)) {}

bool AssetCatalog::is_video_file(const std::string &path) {
  return VIDEO_EXTS.count(lower_extension(path)) > 0;
}

bool AssetCatalog::is_audio_file(const std::string &path) {
  return AUDIO_EXTS.count(lower_extension(path)) > 0;
}

SourceAsset AssetCatalog::make_asset(const std::string &path) {
  fs::path p = fs::absolute(path).lexically_normal();
  SourceAsset asset;
  asset.path = p.string();
  asset.stem = p.stem().string();
  asset.extension = lower_extension(p);

  std::error_code ec;
  asset.size_bytes = fs::file_size(p, ec);
  if (ec)
    asset.size_bytes = 0;

  auto mtime = fs::last_write_time(p, ec);
  if (!ec) {
    asset.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                         mtime.time_since_epoch())
                         .count();
  }
  return asset;
}

std::vector<SourceAsset>
AssetCatalog::list_videos(const std::vector<std::string> &dirs) {
  std::vector<SourceAsset> assets;
  for (const auto &dir : dirs) {
    auto files = collect_files(dir, &AssetCatalog::is_video_file);
    if (files.empty()) {
      throw EmptyCatalog(dir);
    }
    LOG_INFO("  - {} ({} videos)", dir, files.size());
    for (const auto &f : files) {
      assets.push_back(make_asset(f));
    }
  }
  return assets;
}

std::vector<std::string> AssetCatalog::resolve_bgm(const std::string &path) {
  if (fs::is_regular_file(path)) {
    if (!is_audio_file(path)) {
      throw EmptyCatalog(path);
    }
    return {fs::absolute(path).lexically_normal().string()};
  }
  auto tracks = collect_files(path, &AssetCatalog::is_audio_file);
  if (tracks.empty()) {
    throw EmptyCatalog(path);
  }
  return tracks;
}

AssetCatalog AssetCatalog::scan(const std::vector<std::string> &video_dirs,
                                const std::string &bgm_path) {
  auto videos = list_videos(video_dirs);
  auto bgm = resolve_bgm(bgm_path);
  return AssetCatalog(std::move(videos), std::move(bgm));
}

std::vector<ResolutionGroup>
AssetCatalog::group_by_resolution(MediaProber &prober) const {
  std::map<std::pair<int, int>, ResolutionGroup> by_res;
  for (const auto &asset : videos_) {
    MediaInfo info;
    if (!prober.probe(asset.path, info) || info.width <= 0 || info.height <= 0) {
      LOG_WARN("Skipping unprobeable video in grouping: {}", asset.path);
      continue;
    }
    auto &group = by_res[{info.width, info.height}];
    group.width = info.width;
    group.height = info.height;
    group.assets.push_back(asset);
  }

  std::vector<ResolutionGroup> groups;
  groups.reserve(by_res.size());
  for (auto &kv : by_res) {
    groups.push_back(std::move(kv.second));
  }
  /// Stable: equal-sized groups keep resolution order
  std::stable_sort(groups.begin(), groups.end(),
                   [](const ResolutionGroup &a, const ResolutionGroup &b) {
                     return a.assets.size() > b.assets.size();
                   });
  return groups;
}

} // namespace clip_mix
