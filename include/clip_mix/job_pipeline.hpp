/**
 * @file job_pipeline.hpp
 * @brief Processing of one output job
 *
 * @details The JobPipeline runs one OutputJob through:
 *
 *          1. Segment preparation: get_or_build every selected clip
 *
 *          2. Concatenation into a silent video under the work directory
 *
 *          3. BGM replacement into the final output path
 *
 *          4. Compression report and scratch cleanup
 *
 * @note Every log line is prefixed with [Job N]. A hardware encoder failure
 *       switches the rest of this job (and only this job) to software.
 */

#ifndef CLIP_MIX_JOB_PIPELINE_HPP
#define CLIP_MIX_JOB_PIPELINE_HPP

#include <atomic>
#include <string>

#include "audio_replacer.hpp"
#include "clip_cache.hpp"
#include "clip_transcoder.hpp"
#include "concatenator.hpp"
#include "encoding_profile.hpp"
#include "run_events.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @struct PipelineContext
 * @brief Shared collaborators handed to every job at dispatch.
 * @note Only `cache` is mutable shared state; `encoding` is the run's
 *       once-resolved profile and is copied into each job.
 */
struct PipelineContext {
  ClipCache &cache;
  ClipTranscoder &transcoder;
  Concatenator &concatenator;
  AudioReplacer &audio;
  MediaProber &prober;
  const EncodingProfileResolver &encoders;
  RunObserver &observer;
  NormalizationProfile profile;
  EncodingProfile encoding;
  std::string work_dir;
  const std::atomic<bool> *cancel = nullptr; //< Optional cancellation flag
};

/**
 * @class JobPipeline
 * @brief Runs one job to a JobResult.
 *
 * @attention Never throws for job-level failures: SegmentBuildFailed,
 *            ProfileMismatch, MuxFailed and any other error are recorded in
 *            the returned JobResult together with the failing stage.
 */
class JobPipeline {
public:
  JobPipeline(const OutputJob &job, PipelineContext &ctx);

  JobResult run();

private:
  bool cancelled() const;

  /// get_or_build with the per-job hardware to software fallback
  CacheEntry prepare_segment(const SegmentChoice &choice, JobResult &result);

  double target_duration(const std::string &silent_path);

  const OutputJob &job_;
  PipelineContext &ctx_;
  EncodingProfile encoding_;
};

} // namespace clip_mix

#endif // CLIP_MIX_JOB_PIPELINE_HPP
