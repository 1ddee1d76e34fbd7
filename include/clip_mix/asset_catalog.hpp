/**
 * @file asset_catalog.hpp
 * @brief Input discovery: source videos and background music tracks
 */

#ifndef CLIP_MIX_ASSET_CATALOG_HPP
#define CLIP_MIX_ASSET_CATALOG_HPP

#include <string>
#include <vector>

#include "media_probe.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @struct ResolutionGroup
 * @brief Source videos sharing one native resolution.
 */
struct ResolutionGroup {
  int width = 0;
  int height = 0;
  std::vector<SourceAsset> assets;

  std::string label() const;
};

/**
 * @class AssetCatalog
 * @brief Ordered listings of the source videos and BGM tracks of a run.
 * @note Enumerated once per run and immutable afterwards. Listings are
 *       sorted by path so a fixed seed reproduces the same selection.
 */
class AssetCatalog {
public:
  AssetCatalog(std::vector<SourceAsset> videos, std::vector<std::string> bgm);

  /**
   * @brief Scan video directories and resolve the BGM source.
   * @throws EmptyCatalog if any directory or the BGM source has no usable file
   */
  static AssetCatalog scan(const std::vector<std::string> &video_dirs,
                           const std::string &bgm_path);

  /**
   * @brief Recursively list the video files of every directory.
   * @param dirs Input directories, each required to hold at least one video
   * @return Assets sorted by path within each directory, directories in order
   * @throws EmptyCatalog naming the first directory without a video
   */
  static std::vector<SourceAsset>
  list_videos(const std::vector<std::string> &dirs);

  /**
   * @brief Resolve a BGM path to the list of candidate tracks.
   * @param path An audio file (singleton result) or a directory (every
   *             audio file below it, sorted)
   * @throws EmptyCatalog if no recognised audio file is found
   */
  static std::vector<std::string> resolve_bgm(const std::string &path);

  /// Stat a file into a SourceAsset (absolute path, stem, size, mtime)
  static SourceAsset make_asset(const std::string &path);

  static bool is_video_file(const std::string &path);
  static bool is_audio_file(const std::string &path);

  const std::vector<SourceAsset> &videos() const { return videos_; }
  const std::vector<std::string> &bgm_tracks() const { return bgm_; }

  /**
   * @brief Partition videos by probed native resolution.
   * @param prober Prober used for every video (lazy, memoized by caller)
   * @return Groups ordered by size (largest first); files that fail to
   *         probe are left out
   */
  std::vector<ResolutionGroup> group_by_resolution(MediaProber &prober) const;

private:
  std::vector<SourceAsset> videos_;
  std::vector<std::string> bgm_;
};

} // namespace clip_mix

#endif // CLIP_MIX_ASSET_CATALOG_HPP
