/**
 * @file job_scheduler.hpp
 * @brief Bounded worker pool running output jobs in parallel
 *
 * @details The JobScheduler orchestrates parallel job processing:
 *
 *          - Spawns min(max_concurrency, jobs) worker threads, at least one
 *
 *          - Workers pull jobs from a shared JobQueue
 *
 *          - A failing job is recorded and the others keep running
 *
 *          - Logging is job-prefixed for clarity
 *
 * @note Cancellation: once the flag is raised no further job is dispatched.
 *       Jobs still queued are reported as Cancelled; running jobs stop at
 *       their next stage boundary.
 */

#ifndef CLIP_MIX_JOB_SCHEDULER_HPP
#define CLIP_MIX_JOB_SCHEDULER_HPP

#include <atomic>
#include <functional>
#include <vector>

#include "job_queue.hpp"
#include "run_events.hpp"
#include "types.hpp"

namespace clip_mix {

/**
 * @class JobScheduler
 * @brief Runs jobs on a bounded pool and collects every JobResult.
 */
class JobScheduler {
public:
  /// Executes one job; job-level failures are expected in the result
  using JobFunction = std::function<JobResult(const OutputJob &)>;

  /**
   * @param run_job Job body, typically a JobPipeline
   * @param observer Receives a completion event per job
   * @param cancel Optional run-level cancellation flag
   */
  JobScheduler(JobFunction run_job, RunObserver &observer,
               const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Run every job.
   * @param jobs Jobs to run
   * @param max_concurrency Worker pool size (clamped to [1, jobs])
   * @return One JobResult per job, ordered by job index
   */
  std::vector<JobResult> run(const std::vector<OutputJob> &jobs,
                             int max_concurrency);

  /// Pool size used by the last run()
  int workers() const { return workers_; }

private:
  void worker(int worker_id, const std::vector<OutputJob> &jobs);

  /// Job body with the job boundary: exceptions become Failed results
  JobResult run_guarded(const OutputJob &job);

  bool cancelled() const { return cancel_ != nullptr && cancel_->load(); }

  JobFunction run_job_;
  RunObserver &observer_;
  const std::atomic<bool> *cancel_;

  JobQueue queue_;
  ResultCollector results_;
  std::atomic<int> jobs_done_{0};
  int total_jobs_ = 0;
  int workers_ = 0;
};

} // namespace clip_mix

#endif // CLIP_MIX_JOB_SCHEDULER_HPP
