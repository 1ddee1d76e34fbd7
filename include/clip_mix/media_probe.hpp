/**
 * @file media_probe.hpp
 * @brief In-process media probing with libavformat
 *
 * @details The MediaProber interface answers "how big, how fast, how long"
 *          for a media file. LibavMediaProber opens the container with
 *          libavformat and reads the best video stream (or, for audio-only
 *          files, only the duration). CachingProber memoizes results so a
 *          source asset is probed at most once per run.
 *
 * @attention THREAD MODEL:
 *            - LibavMediaProber creates a fresh AVFormatContext per call,
 *              so concurrent calls from different workers are safe.
 *
 *            - CachingProber guards its memo with a mutex; the probe itself
 *              runs outside the lock.
 */

#ifndef CLIP_MIX_MEDIA_PROBE_HPP
#define CLIP_MIX_MEDIA_PROBE_HPP

#include <map>
#include <mutex>
#include <string>

#include "types.hpp"

namespace clip_mix {

/**
 * @class MediaProber
 * @brief Reads stream attributes of a media file.
 */
class MediaProber {
public:
  virtual ~MediaProber() = default;

  /**
   * @brief Probe a file.
   * @param path Path to the media file
   * @param info Output: probed attributes
   * @return true on success, false if the file could not be probed
   */
  virtual bool probe(const std::string &path, MediaInfo &info) = 0;
};

/**
 * @class LibavMediaProber
 * @brief MediaProber backed by libavformat.
 */
class LibavMediaProber : public MediaProber {
public:
  LibavMediaProber();

  bool probe(const std::string &path, MediaInfo &info) override;
};

/**
 * @class CachingProber
 * @brief Memoizing decorator around another MediaProber.
 * @note Failures are memoized too, so a broken file is not re-opened by
 *       every job that selects it.
 */
class CachingProber : public MediaProber {
public:
  explicit CachingProber(MediaProber &inner) : inner_(inner) {}

  bool probe(const std::string &path, MediaInfo &info) override;

private:
  struct Memo {
    bool ok;
    MediaInfo info;
  };

  MediaProber &inner_;
  std::mutex mutex_;
  std::map<std::string, Memo> memo_;
};

} // namespace clip_mix

#endif // CLIP_MIX_MEDIA_PROBE_HPP
