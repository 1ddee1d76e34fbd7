/**
 * @file job_queue.hpp
 * @brief Thread-safe job queue and result collection
 *
 * @details Provides:
 *          - JobQueue: shared queue the scheduler's workers pull from
 *
 *          - ResultCollector: thread-safe aggregator for JobResults
 */

#ifndef CLIP_MIX_JOB_QUEUE_HPP
#define CLIP_MIX_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <vector>

#include "types.hpp"

namespace clip_mix {

/**
 * @class JobQueue
 * @brief Work queue of job positions for dynamic load balancing.
 *
 * @attention DESIGN:
 *
 * - Workers pop the next job as soon as they finish one
 *
 * - A slow job (long clips, many cache misses) never holds back the others
 */
class JobQueue {
  std::queue<size_t> jobs;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a job position to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(size_t job);

  /**
   * @brief Pop the next job position.
   * @note Blocks until a job is available or the queue is finished.
   * @return true if a job was retrieved, false if queue is empty and done
   */
  bool pop(size_t &job);

  /**
   * @brief Drain every job still queued.
   * @return The positions that were never handed to a worker
   */
  std::vector<size_t> drain();

  /**
   * @brief Signal that no more jobs will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe aggregator for job results.
 */
class ResultCollector {
  std::vector<JobResult> results;
  std::mutex mutex;

public:
  void reserve(size_t n);

  /// Add one finished job's result
  void add(JobResult &&result);

  /**
   * @brief Extract all collected results, ordered by job index.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<JobResult> extract();
};

} // namespace clip_mix

#endif // CLIP_MIX_JOB_QUEUE_HPP
