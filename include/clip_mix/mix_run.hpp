/**
 * @file mix_run.hpp
 * @brief One complete mix run, from settings to summary
 *
 * @details Run phases:
 *
 *          1. Validate settings, check the ffmpeg executable
 *
 *          2. Scan inputs (AssetCatalog), resolve the encoding profile once
 *
 *          3. Plan jobs: per-job seed, selection and BGM track
 *
 *          4. Dispatch on the JobScheduler. When grouped selection yields
 *             no output at all, every output is retried ungrouped
 *
 *          5. Summarize
 *
 * @note Run-fatal errors (InvalidSettings, ExternalToolMissing,
 *       EmptyCatalog) are thrown before any job is dispatched.
 */

#ifndef CLIP_MIX_MIX_RUN_HPP
#define CLIP_MIX_MIX_RUN_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "asset_catalog.hpp"
#include "command_runner.hpp"
#include "config.hpp"
#include "media_probe.hpp"
#include "run_events.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @brief Split `outputs` across groups in proportion to their sizes.
 *
 * @details Every group gets one output while outputs remain (largest
 *          groups first). The rest is shared by largest remainder; ties go
 *          to the earlier group.
 *
 * @param group_sizes Sizes, largest first
 * @return Outputs per group, same order
 */
std::vector<int> allocate_outputs(const std::vector<size_t> &group_sizes,
                                  int outputs);

/**
 * @class MixRun
 * @brief Runs one invocation end to end.
 */
class MixRun {
public:
  /**
   * @param settings Run configuration
   * @param runner Executes every ffmpeg command
   * @param prober Media prober (wrapped in a CachingProber for the run)
   * @param observer Event sink
   * @param cancel Optional cancellation flag (e.g. set by SIGINT)
   */
  MixRun(RunSettings settings, CommandRunner &runner, MediaProber &prober,
         RunObserver &observer, const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Execute the run.
   * @return Summary with one JobResult per requested output
   * @throws InvalidSettings, ExternalToolMissing, EmptyCatalog
   */
  RunSummary execute();

  /**
   * @brief Build the job list for a catalog.
   * @param prober Used for resolution grouping only
   * @param allow_grouping false forces ungrouped selection even when
   *        grouping by resolution is configured
   */
  std::vector<OutputJob> plan_jobs(const AssetCatalog &catalog,
                                   MediaProber &prober,
                                   std::uint64_t run_seed,
                                   bool allow_grouping = true) const;

  const RunSettings &settings() const { return settings_; }

private:
  RunSettings settings_;
  CommandRunner &runner_;
  MediaProber &prober_;
  RunObserver &observer_;
  const std::atomic<bool> *cancel_;
};

} // namespace clip_mix

#endif // CLIP_MIX_MIX_RUN_HPP
