/**
 * @file clip_cache.cpp
 * @brief Segment cache implementation
 */

#include "clip_mix/clip_cache.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"
#include "clip_mix/logging.hpp"
#include "clip_mix/system.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

const std::string SEP = "__";
const std::string SEGMENT_EXT = ".ts";
const std::string TEMP_MARK = ".tmp-";
const std::string LOCK_EXT = ".lock";

/// Removes a temporary file unless it was committed
class TempFile {
public:
  explicit TempFile(std::string path) : path_(std::move(path)) {}
  ~TempFile() {
    if (!committed_) {
      std::error_code ec;
      fs::remove(path_, ec);
    }
  }

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  const std::string &path() const { return path_; }
  void commit() { committed_ = true; }

private:
  std::string path_;
  bool committed_ = false;
};

bool non_empty_file(const std::string &path) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  return !ec && size > 0;
}

} // anonymous namespace

// **---- KeyLock ----**

KeyLock::KeyLock(std::string path) : path_(std::move(path)) {}

KeyLock::~KeyLock() { close_fd(); }

void KeyLock::close_fd() {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool KeyLock::acquire(int operation) {
  for (;;) {
    if (fd_ == -1) {
      fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
      if (fd_ == -1) {
        int err = errno;
        throw Error(fmt::format("cannot open cache lock {}: {}", path_,
                                std::strerror(err)));
      }
    }
    if (::flock(fd_, operation) == -1) {
      int err = errno;
      if (err == EINTR)
        continue;
      if (err == EWOULDBLOCK && (operation & LOCK_NB) != 0)
        return false;
      throw Error(fmt::format("cannot lock {}: {}", path_, std::strerror(err)));
    }

    struct stat held {};
    struct stat named {};
    if (::fstat(fd_, &held) == 0 && ::stat(path_.c_str(), &named) == 0 &&
        held.st_dev == named.st_dev && held.st_ino == named.st_ino) {
      return true;
    }
    /// Purged while we waited: lock the current file instead
    close_fd();
  }
}

void KeyLock::lock_shared() { acquire(LOCK_SH); }

void KeyLock::lock_exclusive() { acquire(LOCK_EX); }

bool KeyLock::try_lock_exclusive() { return acquire(LOCK_EX | LOCK_NB); }

void KeyLock::remove_file() {
  if (::unlink(path_.c_str()) == -1 && errno != ENOENT) {
    int err = errno;
    LOG_WARN("Cannot remove cache lock {}: {}", path_, std::strerror(err));
  }
}

// **---- CacheKey ----**

CacheKey CacheKey::make(const SourceAsset &asset, const TrimSpec &trim,
                        const NormalizationProfile &profile) {
  CacheKey key;
  key.stem = asset.stem;
  key.source_hash = short_hash(asset.path);
  key.trim = trim.canonical();
  key.profile_tag = profile.tag();
  key.signature = asset.signature();
  return key;
}

std::string CacheKey::file_name() const {
  return source_prefix() + trim + SEP + profile_tag + SEP + signature +
         SEGMENT_EXT;
}

std::string CacheKey::source_prefix() const {
  return stem + SEP + source_hash + SEP;
}

bool CacheKey::parse(const std::string &file_name, CacheKey &key) {
  if (file_name.size() <= SEGMENT_EXT.size() ||
      file_name.compare(file_name.size() - SEGMENT_EXT.size(),
                        SEGMENT_EXT.size(), SEGMENT_EXT) != 0) {
    return false;
  }
  std::string body = file_name.substr(0, file_name.size() - SEGMENT_EXT.size());

  /// Split from the right: the stem itself may contain "__"
  std::vector<std::string> fields;
  for (int i = 0; i < 4; ++i) {
    auto pos = body.rfind(SEP);
    if (pos == std::string::npos)
      return false;
    fields.push_back(body.substr(pos + SEP.size()));
    body.erase(pos);
  }
  if (body.empty())
    return false;
  for (const auto &f : fields) {
    if (f.empty())
      return false;
  }

  key.stem = body;
  key.source_hash = fields[3];
  key.trim = fields[2];
  key.profile_tag = fields[1];
  key.signature = fields[0];
  return true;
}

// **---- ClipCache ----**

ClipCache::ClipCache(std::string dir, ClipTranscoder &transcoder)
    : dir_(std::move(dir)), transcoder_(transcoder) {
  lock_dir_ = (fs::path(dir_) / ".locks").string();
  fs::create_directories(lock_dir_);
}

std::string ClipCache::path_for(const CacheKey &key) const {
  return (fs::path(dir_) / key.file_name()).string();
}

CacheStats ClipCache::stats() const {
  CacheStats s;
  s.hits = hits_.load();
  s.builds = builds_.load();
  s.purged = purged_.load();
  return s;
}

std::string ClipCache::lock_path(const std::string &name) const {
  return (fs::path(lock_dir_) / (name + LOCK_EXT)).string();
}

CacheEntry ClipCache::get_or_build(const SourceAsset &asset,
                                   const TrimSpec &trim,
                                   const NormalizationProfile &profile,
                                   const EncodingProfile &encoding) {
  const CacheKey key = CacheKey::make(asset, trim, profile);
  const std::string name = key.file_name();

  std::promise<CacheEntry> promise;
  std::shared_future<CacheEntry> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(name);
    if (it != in_flight_.end()) {
      pending = it->second;
    } else {
      auto live = live_.find(name);
      if (live != live_.end()) {
        if (non_empty_file(path_for(key))) {
          ++hits_;
          return CacheEntry{path_for(key), asset.path, trim, profile, true};
        }
        /// Deleted from outside: give up the lease so the rebuild can lock
        live_.erase(live);
      }
      in_flight_.emplace(name, promise.get_future().share());
    }
  }

  /// Another job is building this key: wait for its outcome
  if (pending.valid()) {
    CacheEntry entry = pending.get();
    entry.from_cache = true;
    ++hits_;
    return entry;
  }

  try {
    std::unique_ptr<KeyLock> lease;
    CacheEntry entry = build(key, asset, trim, profile, encoding, lease);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      live_[name] = std::move(lease);
      in_flight_.erase(name);
    }
    promise.set_value(entry);
    return entry;
  } catch (...) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_.erase(name);
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

CacheEntry ClipCache::build(const CacheKey &key, const SourceAsset &asset,
                            const TrimSpec &trim,
                            const NormalizationProfile &profile,
                            const EncodingProfile &encoding,
                            std::unique_ptr<KeyLock> &lease) {
  const std::string name = key.file_name();
  const std::string final_path = path_for(key);

  /// Built by an earlier run: reuse it alongside any other reader
  auto lock = std::make_unique<KeyLock>(lock_path(name));
  lock->lock_shared();
  if (non_empty_file(final_path)) {
    ++hits_;
    lease = std::move(lock);
    return CacheEntry{final_path, asset.path, trim, profile, true};
  }

  /// A fresh descriptor: the shared lock is released before waiting
  lock = std::make_unique<KeyLock>(lock_path(name));
  lock->lock_exclusive();
  if (non_empty_file(final_path)) {
    lock->lock_shared();
    ++hits_;
    lease = std::move(lock);
    return CacheEntry{final_path, asset.path, trim, profile, true};
  }

  purge_stale(key);

  TempFile temp(fmt::format("{}{}{}-{}", final_path, TEMP_MARK, ::getpid(),
                            temp_counter_++));
  transcoder_.transcode(asset, trim, profile, encoding, temp.path());

  fs::rename(temp.path(), final_path);
  temp.commit();
  ++builds_;
  lock->lock_shared();

  LOG_INFO("Cached segment {}", name);
  lease = std::move(lock);
  return CacheEntry{final_path, asset.path, trim, profile, false};
}

void ClipCache::purge_stale(const CacheKey &key) {
  const std::string name = key.file_name();
  const std::string prefix = key.source_prefix();

  /// Key name -> its segment and temp files, plus keys known only by a lock
  std::map<std::string, std::vector<fs::path>> candidates;
  auto collect = [&](const std::string &dir, const std::string &suffix,
                     bool keep_path) {
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
      std::string file = entry.path().filename().string();
      std::string base = file;
      if (!suffix.empty()) {
        if (file.size() <= suffix.size() ||
            file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0)
          continue;
        base.erase(base.size() - suffix.size());
      }
      auto mark = base.find(TEMP_MARK);
      if (mark != std::string::npos)
        base.erase(mark);

      CacheKey other;
      if (!CacheKey::parse(base, other) || other.source_prefix() != prefix)
        continue;
      auto &files = candidates[base];
      if (keep_path)
        files.push_back(entry.path());
    }
    if (ec) {
      LOG_WARN("Cannot list cache directory {}: {}", dir, ec.message());
    }
  };
  collect(dir_, "", true);
  collect(lock_dir_, LOCK_EXT, false);

  auto remove_counted = [this](const fs::path &path) {
    std::error_code rm_ec;
    if (fs::remove(path, rm_ec)) {
      ++purged_;
      LOG_INFO("Purged stale cache file {}", path.filename().string());
    } else if (rm_ec) {
      LOG_WARN("Cannot remove stale cache file {}: {}", path.string(),
               rm_ec.message());
    }
  };

  for (const auto &candidate : candidates) {
    /// Own key: we hold its lock, so any temp file is an abandoned build
    if (candidate.first == name) {
      for (const auto &path : candidate.second) {
        if (path.filename().string() != name)
          remove_counted(path);
      }
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (live_.count(candidate.first) > 0 ||
          in_flight_.count(candidate.first) > 0)
        continue;
    }

    /// Held by a builder or a reader in some other run
    KeyLock other_lock(lock_path(candidate.first));
    if (!other_lock.try_lock_exclusive()) {
      LOG_INFO("Keeping cache key {}: in use by another run", candidate.first);
      continue;
    }
    for (const auto &path : candidate.second)
      remove_counted(path);
    other_lock.remove_file();
  }
}

} // namespace clip_mix
