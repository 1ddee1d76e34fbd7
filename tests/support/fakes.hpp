// Test doubles for the external-process and media-probe seams, plus a
// scratch directory helper. Nothing here launches ffmpeg or opens media.

#ifndef CLIP_MIX_TESTS_FAKES_HPP
#define CLIP_MIX_TESTS_FAKES_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "clip_mix/command_runner.hpp"
#include "clip_mix/media_probe.hpp"

namespace clip_mix {
namespace test {

namespace fs = std::filesystem;

using Args = std::vector<std::string>;

enum class CommandKind { Version, Encoders, Transcode, Concat, Mux, Other };

inline bool has_arg(const Args &args, const std::string &value) {
  return std::find(args.begin(), args.end(), value) != args.end();
}

/// Value following `flag`, or "" when absent
inline std::string arg_after(const Args &args, const std::string &flag) {
  auto it = std::find(args.begin(), args.end(), flag);
  if (it == args.end() || std::next(it) == args.end())
    return "";
  return *std::next(it);
}

inline CommandKind classify(const Args &args) {
  if (has_arg(args, "-version"))
    return CommandKind::Version;
  if (has_arg(args, "-encoders"))
    return CommandKind::Encoders;
  if (has_arg(args, "-stream_loop"))
    return CommandKind::Mux;
  if (has_arg(args, "mpegts"))
    return CommandKind::Transcode;
  if (has_arg(args, "concat"))
    return CommandKind::Concat;
  return CommandKind::Other;
}

inline void write_file(const std::string &path, size_t bytes) {
  fs::path p(path);
  if (!p.parent_path().empty())
    fs::create_directories(p.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << std::string(bytes, 'x');
}

inline std::string read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/**
 * Records every argument list and imitates ffmpeg by writing the file named
 * by the last argument. Failures and delays are opt-in per command.
 */
class FakeCommandRunner : public CommandRunner {
public:
  bool tool_present = true;    // false: every command fails to launch
  bool hardware_listed = false; // "-encoders" lists hevc_nvenc
  int transcode_delay_ms = 0;
  size_t output_bytes = 2048;
  std::function<bool(const Args &)> fail_when; // true: exit code 1

  CommandResult run(const Args &args) override {
    CommandKind kind = classify(args);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(args);
    }

    CommandResult result;
    if (!tool_present) {
      result.launched = false;
      return result;
    }
    result.launched = true;

    if (kind == CommandKind::Transcode && transcode_delay_ms > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(transcode_delay_ms));
    }

    if (kind == CommandKind::Concat) {
      /// The list lives in a memfd; read it while the caller still holds it
      std::string list = read_file(arg_after(args, "-i"));
      std::lock_guard<std::mutex> lock(mutex_);
      concat_lists_[args.back()] = list;
    }

    if (fail_when && fail_when(args)) {
      result.exit_code = 1;
      result.output = "simulated ffmpeg failure";
      return result;
    }

    result.exit_code = 0;
    switch (kind) {
    case CommandKind::Version:
      result.output = "ffmpeg version 6.1-fake";
      break;
    case CommandKind::Encoders:
      result.output = "Encoders:\n V....D libx264   H.264\n V....D libx265   HEVC\n";
      if (hardware_listed)
        result.output += " V....D hevc_nvenc   NVIDIA NVENC hevc encoder\n";
      break;
    case CommandKind::Transcode:
    case CommandKind::Concat:
    case CommandKind::Mux:
      write_file(args.back(), output_bytes);
      break;
    case CommandKind::Other:
      break;
    }
    return result;
  }

  int count(CommandKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(std::count_if(
        calls_.begin(), calls_.end(),
        [kind](const Args &a) { return classify(a) == kind; }));
  }

  std::vector<Args> calls(CommandKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Args> out;
    for (const auto &a : calls_) {
      if (classify(a) == kind)
        out.push_back(a);
    }
    return out;
  }

  /// Concat list content recorded for an output path
  std::string concat_list(const std::string &output) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = concat_lists_.find(output);
    return it == concat_lists_.end() ? std::string() : it->second;
  }

private:
  mutable std::mutex mutex_;
  std::vector<Args> calls_;
  std::map<std::string, std::string> concat_lists_;
};

/// Answers every probe with `fallback` unless a path has its own entry
class FakeMediaProber : public MediaProber {
public:
  MediaInfo fallback{1920, 1080, 30.0, 8.0};
  std::map<std::string, MediaInfo> by_path;
  std::set<std::string> unreadable;

  bool probe(const std::string &path, MediaInfo &info) override {
    ++calls;
    if (unreadable.count(path) > 0)
      return false;
    auto it = by_path.find(path);
    info = it == by_path.end() ? fallback : it->second;
    return true;
  }

  std::atomic<int> calls{0};
};

/// Unique scratch directory, removed with everything in it
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = fs::temp_directory_path() /
            ("clip_mix_test_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter++));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  std::string str(const std::string &child = "") const {
    return child.empty() ? path_.string() : (path_ / child).string();
  }

private:
  fs::path path_;
};

/// Files in `dir` (non-recursive) whose name ends with `suffix`
inline std::vector<std::string> files_with_suffix(const std::string &dir,
                                                  const std::string &suffix) {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    std::string name = entry.path().filename().string();
    if (name.size() >= suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace test
} // namespace clip_mix

#endif // CLIP_MIX_TESTS_FAKES_HPP
