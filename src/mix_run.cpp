/**
 * @file mix_run.cpp
 * @brief Mix run orchestration
 */

#include "clip_mix/mix_run.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <numeric>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "clip_mix/audio_replacer.hpp"
#include "clip_mix/clip_cache.hpp"
#include "clip_mix/clip_transcoder.hpp"
#include "clip_mix/concatenator.hpp"
#include "clip_mix/encoding_profile.hpp"
#include "clip_mix/job_pipeline.hpp"
#include "clip_mix/job_scheduler.hpp"
#include "clip_mix/logging.hpp"
#include "clip_mix/segment_selector.hpp"
#include "clip_mix/system.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

std::vector<int> allocate_outputs(const std::vector<size_t> &group_sizes,
                                  int outputs) {
  std::vector<int> alloc(group_sizes.size(), 0);
  if (group_sizes.empty() || outputs <= 0)
    return alloc;

  /// Fewer outputs than groups: one each to the largest groups
  if (static_cast<size_t>(outputs) <= group_sizes.size()) {
    for (int i = 0; i < outputs; ++i)
      alloc[static_cast<size_t>(i)] = 1;
    return alloc;
  }

  std::fill(alloc.begin(), alloc.end(), 1);
  int remaining = outputs - static_cast<int>(group_sizes.size());
  size_t total = std::accumulate(group_sizes.begin(), group_sizes.end(),
                                 static_cast<size_t>(0));
  if (total == 0) {
    alloc[0] += remaining;
    return alloc;
  }

  std::vector<double> remainders(group_sizes.size());
  int given = 0;
  for (size_t i = 0; i < group_sizes.size(); ++i) {
    double quota = static_cast<double>(remaining) *
                   static_cast<double>(group_sizes[i]) /
                   static_cast<double>(total);
    int whole = static_cast<int>(quota);
    alloc[i] += whole;
    given += whole;
    remainders[i] = quota - whole;
  }

  std::vector<size_t> order(group_sizes.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return remainders[a] > remainders[b];
  });
  for (size_t k = 0; given < remaining; ++k, ++given) {
    alloc[order[k % order.size()]] += 1;
  }
  return alloc;
}

MixRun::MixRun(RunSettings settings, CommandRunner &runner,
               MediaProber &prober, RunObserver &observer,
               const std::atomic<bool> *cancel)
    : settings_(std::move(settings)), runner_(runner), prober_(prober),
      observer_(observer), cancel_(cancel) {}

std::vector<OutputJob> MixRun::plan_jobs(const AssetCatalog &catalog,
                                         MediaProber &prober,
                                         std::uint64_t run_seed,
                                         bool allow_grouping) const {
  struct Pool {
    std::vector<SourceAsset> assets;
    std::string label;
    int outputs;
  };
  std::vector<Pool> pools;

  if (allow_grouping && settings_.group_by_resolution) {
    std::vector<ResolutionGroup> qualifying;
    for (auto &group : catalog.group_by_resolution(prober)) {
      if (static_cast<int>(group.assets.size()) > settings_.group_min_size) {
        qualifying.push_back(std::move(group));
      } else {
        LOG_INFO("Group {} has {} videos (<= {}), ignored", group.label(),
                 group.assets.size(), settings_.group_min_size);
      }
    }

    if (qualifying.empty()) {
      LOG_WARN("No resolution group has more than {} videos, using ungrouped "
               "selection",
               settings_.group_min_size);
    } else {
      std::vector<size_t> sizes;
      for (const auto &g : qualifying)
        sizes.push_back(g.assets.size());
      auto alloc = allocate_outputs(sizes, settings_.outputs);
      for (size_t i = 0; i < qualifying.size(); ++i) {
        if (alloc[i] == 0)
          continue;
        LOG_INFO("Group {}: {} videos -> {} outputs", qualifying[i].label(),
                 qualifying[i].assets.size(), alloc[i]);
        pools.push_back({std::move(qualifying[i].assets),
                         qualifying[i].label(), alloc[i]});
      }
    }
  }

  if (pools.empty()) {
    pools.push_back({catalog.videos(), "", settings_.outputs});
  }

  std::vector<OutputJob> jobs;
  jobs.reserve(static_cast<size_t>(settings_.outputs));
  int index = 1;
  for (const auto &pool : pools) {
    SegmentSelector selector(pool.assets, catalog.bgm_tracks(), settings_.trim);
    selector.set_count(settings_.clips_per_output);
    if (settings_.clips_per_output > static_cast<int>(pool.assets.size())) {
      LOG_WARN("{} clips per output but only {} videos{}: sampling with "
               "replacement",
               settings_.clips_per_output, pool.assets.size(),
               pool.label.empty() ? "" : " in group " + pool.label);
    }

    for (int n = 0; n < pool.outputs; ++n, ++index) {
      OutputJob job;
      job.index = index;
      job.seed = derive_job_seed(run_seed, index);
      JobDraw draw = selector.draw(job.seed);
      job.selection = std::move(draw.selection);
      job.bgm_path = std::move(draw.bgm_path);
      job.output_path = settings_.output_path_for(index);
      job.group_label = pool.label;
      jobs.push_back(std::move(job));
    }
  }
  return jobs;
}

RunSummary MixRun::execute() {
  auto run_start = std::chrono::steady_clock::now();

  // **----- PHASE 1: SETTINGS AND TOOLS -----**

  observer_.on_phase("SETUP");
  validate_settings(settings_);

  EncoderOverrides overrides;
  overrides.nvenc_cq = settings_.nvenc_cq_override;
  overrides.x265_crf = settings_.x265_crf_override;
  overrides.preset_gpu = settings_.preset_gpu_override;
  overrides.preset_cpu = settings_.preset_cpu_override;
  EncodingProfileResolver encoders(runner_, settings_.ffmpeg_bin,
                                   settings_.quality, overrides);
  encoders.ensure_tool();

  // **----- PHASE 2: CATALOG -----**

  observer_.on_phase("CATALOG");
  LOG_INFO("Input directories:");
  AssetCatalog catalog =
      AssetCatalog::scan(settings_.video_dirs, settings_.bgm_path);
  LOG_INFO("Videos: {} | BGM tracks: {}", catalog.videos().size(),
           catalog.bgm_tracks().size());

  const EncodingProfile encoding = encoders.resolve(settings_.prefer_hardware);
  LOG_INFO("Encoder: {} ({} {}, preset {}, {} {})", encoding.codec,
           to_string(encoding.family), to_string(encoding.quality),
           encoding.preset, encoding.is_hardware() ? "cq" : "crf",
           encoding.quality_value);
  LOG_INFO("Profile: {} | trim {}", settings_.profile.tag(),
           settings_.trim.canonical());

  // **----- PHASE 3: PLAN -----**

  observer_.on_phase("PLAN");
  CachingProber probe_cache(prober_);
  std::uint64_t run_seed =
      settings_.run_seed != 0 ? settings_.run_seed : generate_run_seed();
  LOG_INFO("Run seed: {}", run_seed);

  std::vector<OutputJob> jobs = plan_jobs(catalog, probe_cache, run_seed);

  const std::string work_dir = settings_.resolved_work_dir();
  fs::create_directories(settings_.output_dir());
  fs::create_directories(work_dir);
  LOG_INFO("Output: {}", settings_.output_dir());
  LOG_INFO("Cache: {}", settings_.resolved_cache_dir());

  // **----- PHASE 4: PROCESS -----**

  observer_.on_phase("PROCESS");
  ClipTranscoder transcoder(runner_, probe_cache, settings_.ffmpeg_bin);
  ClipCache cache(settings_.resolved_cache_dir(), transcoder);
  Concatenator concatenator(runner_, settings_.ffmpeg_bin);
  AudioReplacer audio(runner_, settings_.ffmpeg_bin, settings_.audio_bitrate);

  PipelineContext ctx{cache,       transcoder,        concatenator,
                      audio,       probe_cache,       encoders,
                      observer_,   settings_.profile, encoding,
                      work_dir,    cancel_};

  auto run_job = [&ctx](const OutputJob &job) {
    return JobPipeline(job, ctx).run();
  };
  JobScheduler scheduler(run_job, observer_, cancel_);

  int workers = calculate_worker_count(settings_.workers,
                                       static_cast<int>(jobs.size()));

  RunSummary summary;
  summary.results = scheduler.run(jobs, workers);
  summary.workers = scheduler.workers();

  /// Grouped selection produced nothing: retry every output ungrouped
  bool grouped = std::any_of(jobs.begin(), jobs.end(), [](const OutputJob &j) {
    return !j.group_label.empty();
  });
  bool cancelled = cancel_ != nullptr && cancel_->load();
  if (grouped && !cancelled && summary.succeeded() == 0) {
    LOG_WARN("No grouped output succeeded, retrying with ungrouped selection");
    observer_.on_phase("PROCESS (ungrouped)");
    jobs = plan_jobs(catalog, probe_cache, run_seed, false);
    JobScheduler retry(run_job, observer_, cancel_);
    summary.results = retry.run(jobs, workers);
  }
  summary.cache = cache.stats();
  summary.run_seed = run_seed;

  /// Only removes the scratch directory when every job cleaned up
  std::error_code ec;
  fs::remove(work_dir, ec);

  summary.wall_clock_sec = std::chrono::duration<double>(
                               std::chrono::steady_clock::now() - run_start)
                               .count();

  observer_.on_phase("SUMMARY");
  observer_.on_summary(summary);
  return summary;
}

} // namespace clip_mix
