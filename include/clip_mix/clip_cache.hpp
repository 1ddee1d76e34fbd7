/**
 * @file clip_cache.hpp
 * @brief Content-keyed cache of normalized, silent clip segments
 *
 * @details A cache file name carries its whole key:
 *
 *          <stem>__<path hash>__<trim>__<profile tag>__<signature>.ts
 *
 *          e.g. "beach__3f2a91c0__h0_t1__1080x1920_25fps_pad__a1b2c3d4.ts"
 *
 *          A segment is built once, under a temporary name, and renamed
 *          into place only after the transcode succeeded. Readers therefore
 *          never see a partial file.
 *
 * @attention CONCURRENCY:
 *
 *   - In-process: a keyed map of shared futures. The first caller for a
 *     key builds it, later callers wait on the same future. Unrelated keys
 *     never wait on each other.
 *
 *   - Cross-process: every key has an flock on <cache>/.locks/<name>.lock.
 *     It is held exclusively while the segment is built or purged, and
 *     shared for as long as a ClipCache instance has handed the segment
 *     out. A run therefore never deletes a segment another run is using.
 *
 * @note STALE POLICY (purge-on-miss): on a miss, every other key of the
 *       same source (same stem and path hash) is deleted before the build
 *       together with its leftover temp files and its lock file. A key
 *       whose lock cannot be taken exclusively without waiting is in use
 *       and is skipped.
 */

#ifndef CLIP_MIX_CLIP_CACHE_HPP
#define CLIP_MIX_CLIP_CACHE_HPP

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "clip_transcoder.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @struct CacheKey
 * @brief Parsed components of a cache file name.
 */
struct CacheKey {
  std::string stem;
  std::string source_hash; //< short_hash of the absolute source path
  std::string trim;        //< TrimSpec::canonical()
  std::string profile_tag; //< NormalizationProfile::tag()
  std::string signature;   //< SourceAsset::signature()

  static CacheKey make(const SourceAsset &asset, const TrimSpec &trim,
                       const NormalizationProfile &profile);

  /**
   * @brief Recover a key from a cache file name.
   * @return false if the name is not a cache segment
   */
  static bool parse(const std::string &file_name, CacheKey &key);

  std::string file_name() const;

  /// "<stem>__<hash>__", shared by every key of one source file
  std::string source_prefix() const;
};

/**
 * @struct CacheStats
 * @brief Counters of one cache instance.
 */
struct CacheStats {
  long hits = 0;   //< Served without a transcode
  long builds = 0; //< Transcodes that produced a segment
  long purged = 0; //< Stale files deleted
};

/**
 * @class KeyLock
 * @brief flock on one key's lock file, released on destruction.
 *
 * @note The lock file may be unlinked by a purge while another process is
 *       waiting on it. After every acquisition the open file is compared
 *       with the path, and a stale file is reopened before retrying.
 */
class KeyLock {
public:
  explicit KeyLock(std::string path);
  ~KeyLock();

  KeyLock(const KeyLock &) = delete;
  KeyLock &operator=(const KeyLock &) = delete;

  void lock_shared();
  void lock_exclusive();

  /// @return false if another holder (shared or exclusive) exists
  bool try_lock_exclusive();

  /// Delete the lock file; only while holding it exclusively
  void remove_file();

private:
  bool acquire(int operation);
  void close_fd();

  std::string path_;
  int fd_ = -1;
};

/**
 * @class ClipCache
 * @brief get_or_build front end over a cache directory.
 */
class ClipCache {
public:
  ClipCache(std::string dir, ClipTranscoder &transcoder);

  /**
   * @brief Return the segment for (asset, trim, profile), building it once.
   *
   * @param encoding Encoder used if the segment has to be built
   * @return Entry with from_cache == true when no transcode was needed by
   *         this call
   * @throws SegmentBuildFailed, HardwareEncoderUnavailable from the build
   *         (also delivered to every caller waiting on the same key)
   */
  CacheEntry get_or_build(const SourceAsset &asset, const TrimSpec &trim,
                          const NormalizationProfile &profile,
                          const EncodingProfile &encoding);

  std::string path_for(const CacheKey &key) const;
  const std::string &dir() const { return dir_; }
  CacheStats stats() const;

private:
  /// Builds or finds the segment; `lease` ends up holding its shared lock
  CacheEntry build(const CacheKey &key, const SourceAsset &asset,
                   const TrimSpec &trim, const NormalizationProfile &profile,
                   const EncodingProfile &encoding,
                   std::unique_ptr<KeyLock> &lease);

  /// Delete other unused keys of the same source and leftover temp files
  void purge_stale(const CacheKey &key);

  std::string lock_path(const std::string &name) const;

  std::string dir_;
  std::string lock_dir_;
  ClipTranscoder &transcoder_;

  std::mutex mutex_; //< Guards in_flight_ and live_
  std::map<std::string, std::shared_future<CacheEntry>> in_flight_;
  /// Names built or served this run, each with its shared lease
  std::map<std::string, std::unique_ptr<KeyLock>> live_;

  std::atomic<long> hits_{0};
  std::atomic<long> builds_{0};
  std::atomic<long> purged_{0};
  std::atomic<unsigned> temp_counter_{0};
};

} // namespace clip_mix

#endif // CLIP_MIX_CLIP_CACHE_HPP
