/**
 * @file concatenator.cpp
 * @brief Segment concatenation implementation
 */

#include "clip_mix/concatenator.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sys/syscall.h>
#include <unistd.h>

#include <fmt/core.h>

#include "clip_mix/errors.hpp"
#include "clip_mix/ffmpeg_commands.hpp"
#include "clip_mix/logging.hpp"

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

/// Owns a memfd holding the concat list
class MemoryListFile {
public:
  explicit MemoryListFile(const std::string &content) {
    fd_ = static_cast<int>(syscall(SYS_memfd_create, "concat_list_mem", MFD_CLOEXEC));
    if (fd_ == -1) {
      throw Error(fmt::format("failed to create memory file: {}",
                              std::strerror(errno)));
    }
    size_t written = 0;
    while (written < content.size()) {
      ssize_t n = ::write(fd_, content.data() + written, content.size() - written);
      if (n == -1) {
        if (errno == EINTR)
          continue;
        int err = errno;
        ::close(fd_);
        throw Error(fmt::format("failed to write memory file: {}",
                                std::strerror(err)));
      }
      written += static_cast<size_t>(n);
    }
  }

  ~MemoryListFile() { ::close(fd_); }

  MemoryListFile(const MemoryListFile &) = delete;
  MemoryListFile &operator=(const MemoryListFile &) = delete;

  std::string path() const { return fmt::format("/proc/{}/fd/{}", ::getpid(), fd_); }

private:
  int fd_ = -1;
};

/// Concat demuxer quoting: ' becomes '\''
std::string quote_path(const std::string &path) {
  std::string quoted;
  quoted.reserve(path.size() + 2);
  quoted += '\'';
  for (char c : path) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

} // anonymous namespace

Concatenator::Concatenator(CommandRunner &runner, std::string ffmpeg_bin)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

std::string Concatenator::build_list(const std::vector<CacheEntry> &segments) {
  std::string list;
  list.reserve(segments.size() * 128);
  for (const auto &s : segments) {
    list += fmt::format("file {}\n", quote_path(fs::absolute(s.path).string()));
  }
  return list;
}

std::string Concatenator::concat(const std::vector<CacheEntry> &segments,
                                 const std::string &output_path) {
  if (segments.empty()) {
    throw Error("no segments to concatenate");
  }

  const NormalizationProfile &expected = segments.front().profile;
  for (size_t i = 1; i < segments.size(); ++i) {
    if (segments[i].profile != expected) {
      throw ProfileMismatch(fmt::format("segment {} is {}, expected {}", i + 1,
                                        segments[i].profile.tag(),
                                        expected.tag()));
    }
  }

  MemoryListFile list(build_list(segments));

  TIMER_START(concat);
  CommandResult result =
      runner_.run(ffmpeg::concat(ffmpeg_bin_, list.path(), output_path));
  TIMER_END(concat);

  if (!result.ok()) {
    std::error_code ec;
    fs::remove(output_path, ec);
    throw Error(fmt::format("concat of {} segments failed (exit {}): {}",
                            segments.size(), result.exit_code, result.tail()));
  }
  return output_path;
}

} // namespace clip_mix
