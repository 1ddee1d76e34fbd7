/**
 * @file job_pipeline.cpp
 * @brief Per-job processing implementation
 */

#include "clip_mix/job_pipeline.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "clip_mix/compression_reporter.hpp"
#include "clip_mix/errors.hpp"
#include "clip_mix/logging.hpp"
#include "clip_mix/system.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

/// Deletes the job's scratch video however the job ends
class ScratchFile {
public:
  explicit ScratchFile(std::string path) : path_(std::move(path)) {}
  ~ScratchFile() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
      LOG_WARN("Cannot remove scratch file {}: {}", path_, ec.message());
    }
  }

  ScratchFile(const ScratchFile &) = delete;
  ScratchFile &operator=(const ScratchFile &) = delete;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // anonymous namespace

JobPipeline::JobPipeline(const OutputJob &job, PipelineContext &ctx)
    : job_(job), ctx_(ctx), encoding_(ctx.encoding) {}

bool JobPipeline::cancelled() const {
  return ctx_.cancel != nullptr && ctx_.cancel->load();
}

CacheEntry JobPipeline::prepare_segment(const SegmentChoice &choice,
                                        JobResult &result) {
  try {
    return ctx_.cache.get_or_build(choice.asset, choice.trim, ctx_.profile,
                                   encoding_);
  } catch (const HardwareEncoderUnavailable &e) {
    if (!encoding_.is_hardware())
      throw;
    EncodingProfile software = ctx_.encoders.fallback(encoding_);
    LOG_WARN("[Job {}] {} failed ({}), falling back to {} crf {}", job_.index,
             encoding_.codec, e.cause(), software.codec, software.quality_value);
    encoding_ = software;
    result.used_fallback = true;
  }
  return ctx_.cache.get_or_build(choice.asset, choice.trim, ctx_.profile,
                                 encoding_);
}

double JobPipeline::target_duration(const std::string &silent_path) {
  MediaInfo info;
  if (ctx_.prober.probe(silent_path, info) && info.duration > 0.0)
    return info.duration;

  /// Probe failed: sum the expected segment lengths instead
  double total = 0.0;
  for (const auto &choice : job_.selection) {
    double length = ctx_.transcoder.expected_length(choice.asset, choice.trim);
    if (length <= 0.0)
      return 0.0;
    total += length;
  }
  return total;
}

JobResult JobPipeline::run() {
  auto start_time = std::chrono::steady_clock::now();

  JobResult result;
  result.index = job_.index;
  for (const auto &choice : job_.selection) {
    result.sources.push_back(choice.asset.path);
  }

  auto finish = [&](JobStatus status) {
    result.status = status;
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());
    return result;
  };
  auto cancel_at = [&](const char *stage) {
    result.stage = stage;
    result.message = "cancelled";
    return finish(JobStatus::Cancelled);
  };

  std::string stage = "cache";
  try {
    if (job_.selection.empty()) {
      throw Error("empty segment selection");
    }

    // **----- SEGMENTS -----**

    TIMER_START(segments);
    std::vector<CacheEntry> segments;
    segments.reserve(job_.selection.size());
    for (size_t i = 0; i < job_.selection.size(); ++i) {
      if (cancelled())
        return cancel_at("cache");
      const SegmentChoice &choice = job_.selection[i];
      CacheEntry entry = prepare_segment(choice, result);
      ctx_.observer.on_job_progress(
          job_.index, "segment",
          fmt::format("{}/{} {} ({})", i + 1, job_.selection.size(),
                      choice.asset.stem, entry.from_cache ? "cached" : "built"));
      segments.push_back(std::move(entry));
    }
    TIMER_END(segments);

    // **----- CONCAT -----**

    if (cancelled())
      return cancel_at("concat");
    stage = "concat";
    ScratchFile silent((fs::path(ctx_.work_dir) /
                        fmt::format("job_{}_silent.mp4", job_.index))
                           .string());
    ctx_.observer.on_job_progress(
        job_.index, "concat", fmt::format("{} segments", segments.size()));
    ctx_.concatenator.concat(segments, silent.path());

    // **----- AUDIO -----**

    if (cancelled())
      return cancel_at("mux");
    stage = "mux";
    double duration = target_duration(silent.path());
    ctx_.observer.on_job_progress(
        job_.index, "mux",
        fmt::format("{} over {}", fs::path(job_.bgm_path).filename().string(),
                    duration > 0.0 ? format_time(duration) : "video length"));
    ctx_.audio.mux(silent.path(), job_.bgm_path, duration, job_.output_path);

  } catch (const std::exception &e) {
    result.stage = stage;
    result.message = e.what();
    return finish(JobStatus::Failed);
  }

  result.output_path = job_.output_path;
  result.compression = CompressionReporter::report(result);
  return finish(JobStatus::Succeeded);
}

} // namespace clip_mix
