/**
 * @file run_events.hpp
 * @brief Progress and result events of a mix run
 *
 * @details A RunObserver receives four kinds of events:
 *
 *          - phase start (catalog scan, planning, processing, ...)
 *
 *          - per-job progress (stage reached by job N)
 *
 *          - per-job completion (the JobResult)
 *
 *          - the final RunSummary
 *
 *          ConsoleReporter renders them with the LOG_* macros,
 *          EventLogWriter appends them to the run log artifact.
 *
 * @attention Job events arrive from worker threads. Observers must be
 *            thread-safe.
 */

#ifndef CLIP_MIX_RUN_EVENTS_HPP
#define CLIP_MIX_RUN_EVENTS_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "clip_cache.hpp"
#include "types.hpp"

namespace clip_mix {

/// File name of the run log inside the output directory
constexpr const char *RUN_LOG_NAME = "clip_mix_run.log";

/**
 * @struct RunSummary
 * @brief Everything a front end needs after a run.
 */
struct RunSummary {
  std::vector<JobResult> results; //< Ordered by job index
  CacheStats cache;
  int workers = 0;
  std::uint64_t run_seed = 0;
  double wall_clock_sec = 0.0;

  int succeeded() const;
  int failed() const;
  int cancelled() const;

  /// 0: at least one output, 1: none
  int exit_code() const { return succeeded() > 0 ? 0 : 1; }
};

/**
 * @class RunObserver
 * @brief Event sink; every callback defaults to doing nothing.
 */
class RunObserver {
public:
  virtual ~RunObserver() = default;

  virtual void on_phase(const std::string &phase) { (void)phase; }

  virtual void on_job_progress(int job_index, const std::string &stage,
                               const std::string &detail) {
    (void)job_index;
    (void)stage;
    (void)detail;
  }

  virtual void on_job_finished(const JobResult &result) { (void)result; }

  virtual void on_summary(const RunSummary &summary) { (void)summary; }
};

/**
 * @class ConsoleReporter
 * @brief Writes events to stdout with the logging macros.
 */
class ConsoleReporter : public RunObserver {
public:
  void on_phase(const std::string &phase) override;
  void on_job_progress(int job_index, const std::string &stage,
                       const std::string &detail) override;
  void on_job_finished(const JobResult &result) override;
  void on_summary(const RunSummary &summary) override;
};

/**
 * @class EventLogWriter
 * @brief Appends one timestamped line per event to a log file.
 * @note The file (and its directory) is created on the first event.
 */
class EventLogWriter : public RunObserver {
public:
  explicit EventLogWriter(std::string path) : path_(std::move(path)) {}

  void on_phase(const std::string &phase) override;
  void on_job_progress(int job_index, const std::string &stage,
                       const std::string &detail) override;
  void on_job_finished(const JobResult &result) override;
  void on_summary(const RunSummary &summary) override;

  const std::string &path() const { return path_; }

private:
  void write_line(const std::string &line);

  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
  bool open_failed_ = false;
};

/**
 * @class ObserverList
 * @brief Fans every event out to several observers, in order.
 */
class ObserverList : public RunObserver {
public:
  void add(RunObserver &observer) { observers_.push_back(&observer); }

  void on_phase(const std::string &phase) override;
  void on_job_progress(int job_index, const std::string &stage,
                       const std::string &detail) override;
  void on_job_finished(const JobResult &result) override;
  void on_summary(const RunSummary &summary) override;

private:
  std::vector<RunObserver *> observers_;
};

} // namespace clip_mix

#endif // CLIP_MIX_RUN_EVENTS_HPP
