/**
 * @file concatenator.hpp
 * @brief Stream-copy concatenation of cached segments
 *
 * @details The concat list is written to an anonymous memory file
 *          (memfd_create) and handed to ffmpeg as /proc/<pid>/fd/<fd>, so
 *          no list file ever touches the disk.
 */

#ifndef CLIP_MIX_CONCATENATOR_HPP
#define CLIP_MIX_CONCATENATOR_HPP

#include <string>
#include <vector>

#include "command_runner.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @class Concatenator
 * @brief Joins segments of one profile into a single silent video.
 */
class Concatenator {
public:
  Concatenator(CommandRunner &runner, std::string ffmpeg_bin);

  /**
   * @brief Concatenate segments in the given order.
   *
   * @param segments Ordered segments, all built to one NormalizationProfile
   * @param output_path Destination MP4 (no audio)
   * @return output_path
   * @throws ProfileMismatch if two segments carry different profiles
   * @throws Error if the list cannot be written or ffmpeg fails
   */
  std::string concat(const std::vector<CacheEntry> &segments,
                     const std::string &output_path);

  /// Concat demuxer list for the segments ("file '<path>'" per line)
  static std::string build_list(const std::vector<CacheEntry> &segments);

private:
  CommandRunner &runner_;
  std::string ffmpeg_bin_;
};

} // namespace clip_mix

#endif // CLIP_MIX_CONCATENATOR_HPP
