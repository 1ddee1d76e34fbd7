/**
 * @file job_scheduler.cpp
 * @brief Parallel job processing implementation
 */

#include "clip_mix/job_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "clip_mix/logging.hpp"

namespace clip_mix {

JobScheduler::JobScheduler(JobFunction run_job, RunObserver &observer,
                           const std::atomic<bool> *cancel)
    : run_job_(std::move(run_job)), observer_(observer), cancel_(cancel) {}

std::vector<JobResult> JobScheduler::run(const std::vector<OutputJob> &jobs,
                                         int max_concurrency) {
  total_jobs_ = static_cast<int>(jobs.size());
  jobs_done_.store(0);
  workers_ = std::max(1, std::min(max_concurrency, std::max(1, total_jobs_)));

  results_.reserve(jobs.size());
  for (size_t i = 0; i < jobs.size(); ++i) {
    queue_.push(i);
  }
  queue_.finish();

  LOG_INFO("Jobs to run: {}", total_jobs_);
  LOG_INFO("Parallel jobs: {}", workers_);

  std::vector<std::thread> pool;
  for (int i = 0; i < workers_; ++i) {
    pool.emplace_back(&JobScheduler::worker, this, i, std::cref(jobs));
  }
  for (auto &t : pool) {
    t.join();
  }

  /// Jobs never handed to a worker after cancellation
  for (size_t pos : queue_.drain()) {
    JobResult result;
    result.index = jobs[pos].index;
    result.status = JobStatus::Cancelled;
    result.stage = "dispatch";
    result.message = "cancelled before start";
    observer_.on_job_finished(result);
    results_.add(std::move(result));
  }

  return results_.extract();
}

JobResult JobScheduler::run_guarded(const OutputJob &job) {
  auto start_time = std::chrono::steady_clock::now();
  JobResult result;
  try {
    result = run_job_(job);
  } catch (const std::exception &e) {
    result = JobResult{};
    result.status = JobStatus::Failed;
    result.stage = "job";
    result.message = e.what();
    result.processing_time_us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time)
            .count());
  }
  result.index = job.index;
  return result;
}

void JobScheduler::worker(int worker_id, const std::vector<OutputJob> &jobs) {
  size_t pos = 0;
  while (!cancelled() && queue_.pop(pos)) {
    const OutputJob &job = jobs[pos];

    LOG_PHASE("[Job {}] ----------------------------------------", job.index);
    LOG_INFO("[Job {}] Worker {} | progress {}/{} | {} clips{}", job.index,
             worker_id, jobs_done_.load() + 1, total_jobs_,
             job.selection.size(),
             job.group_label.empty() ? "" : fmt::format(" | group {}", job.group_label));
    observer_.on_job_progress(job.index, "start",
                              fmt::format("seed {}", job.seed));

    JobResult result = run_guarded(job);
    ++jobs_done_;

    observer_.on_job_finished(result);
    results_.add(std::move(result));
  }
}

} // namespace clip_mix
