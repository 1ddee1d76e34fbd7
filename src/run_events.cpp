/**
 * @file run_events.cpp
 * @brief Console and log-file renderings of run events
 */

#include "clip_mix/run_events.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/core.h>

#include "clip_mix/logging.hpp"
#include "clip_mix/system.hpp"

namespace clip_mix {

namespace fs = std::filesystem;

namespace {

int count_status(const std::vector<JobResult> &results, JobStatus status) {
  int n = 0;
  for (const auto &r : results) {
    if (r.status == status)
      ++n;
  }
  return n;
}

std::string ratio_text(const CompressionStats &c) {
  if (!c.known)
    return "unknown";
  return fmt::format("{:.1f}%", c.ratio * 100.0);
}

} // anonymous namespace

int RunSummary::succeeded() const {
  return count_status(results, JobStatus::Succeeded);
}

int RunSummary::failed() const { return count_status(results, JobStatus::Failed); }

int RunSummary::cancelled() const {
  return count_status(results, JobStatus::Cancelled);
}

// **---- ConsoleReporter ----**

void ConsoleReporter::on_phase(const std::string &phase) {
  LOG_PHASE("================== {} ==================", phase);
}

void ConsoleReporter::on_job_progress(int job_index, const std::string &stage,
                                      const std::string &detail) {
  LOG_INFO("[Job {}] {}: {}", job_index, stage, detail);
}

void ConsoleReporter::on_job_finished(const JobResult &result) {
  switch (result.status) {
  case JobStatus::Succeeded:
    LOG_SUCCESS("[Job {}] Completed: {} ({:.1f}s)", result.index,
                fs::path(result.output_path).filename().string(),
                result.processing_time_us / 1000000.0);
    break;
  case JobStatus::Failed:
    LOG_ERROR("[Job {}] Failed at {}: {}", result.index, result.stage,
              result.message);
    break;
  case JobStatus::Cancelled:
    LOG_WARN("[Job {}] Cancelled", result.index);
    break;
  }
}

void ConsoleReporter::on_summary(const RunSummary &summary) {
  long total_time_us = 0;
  for (const auto &r : summary.results) {
    total_time_us += r.processing_time_us;
  }
  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (summary.wall_clock_sec > 0)
                       ? sum_time_sec / summary.wall_clock_sec
                       : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "==================== MIX RUN SUMMARY ====================\n");
  fmt::print("{:<25} {:>28}\n", "Total outputs:", summary.results.size());
  fmt::print("{:<25} {:>28}\n", "Succeeded:", summary.succeeded());
  fmt::print("{:<25} {:>28}\n", "Failed:", summary.failed());
  fmt::print("{:<25} {:>28}\n", "Cancelled:", summary.cancelled());
  fmt::print("{:<25} {:>28}\n", "Parallel jobs:", summary.workers);
  fmt::print("{:<25} {:>28}\n", "Run seed:", summary.run_seed);
  fmt::print("{:<25} {:>28}\n", "Cache hits / builds:",
             fmt::format("{} / {}", summary.cache.hits, summary.cache.builds));
  fmt::print("{:<25} {:>28}\n", "Stale files purged:", summary.cache.purged);
  fmt::print("{:<25} {:>27.1f}s\n", "Wall-clock time:", summary.wall_clock_sec);
  fmt::print("{:<25} {:>27.1f}s\n", "Sum of job times:", sum_time_sec);
  fmt::print("{:<25} {:>27.2f}x\n", "Speedup:", speedup);

  if (summary.succeeded() > 0) {
    fmt::print(fg(fmt::color::cyan), "\nOutputs:\n");
    fmt::print("{:<4} {:<34} {:>10} {:>9}\n", "Job", "File", "Size", "Ratio");
    for (const auto &r : summary.results) {
      if (!r.ok())
        continue;
      fmt::print("{:<4} {:<34} {:>10} {:>9}{}\n", r.index,
                 fs::path(r.output_path).filename().string(),
                 format_megabytes(r.compression.output_bytes),
                 ratio_text(r.compression), r.used_fallback ? " (cpu)" : "");
    }
  }
  fmt::print(fg(fmt::color::cyan),
             "=========================================================\n");

  if (summary.failed() > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed outputs:\n");
    for (const auto &r : summary.results) {
      if (r.status == JobStatus::Failed) {
        fmt::print(fg(fmt::color::red), "  - job {} [{}] {}\n", r.index,
                   r.stage, r.message);
      }
    }
  }
  std::fflush(stdout);
}

// **---- EventLogWriter ----**

void EventLogWriter::write_line(const std::string &line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_failed_)
    return;

  if (!out_.is_open()) {
    std::error_code ec;
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty())
      fs::create_directories(parent, ec);
    out_.open(path_, std::ios::app);
    if (!out_) {
      open_failed_ = true;
      LOG_WARN("Cannot open run log {}, events go to the console only", path_);
      return;
    }
  }

  std::time_t now = std::chrono::system_clock::to_time_t(
      std::chrono::system_clock::now());
  std::tm local{};
  localtime_r(&now, &local);
  out_ << fmt::format("{:%Y-%m-%d %H:%M:%S} {}\n", local, line);
  out_.flush();
}

void EventLogWriter::on_phase(const std::string &phase) {
  write_line(fmt::format("PHASE {}", phase));
}

void EventLogWriter::on_job_progress(int job_index, const std::string &stage,
                                     const std::string &detail) {
  write_line(fmt::format("JOB {} {} {}", job_index, stage, detail));
}

void EventLogWriter::on_job_finished(const JobResult &result) {
  if (result.ok()) {
    write_line(fmt::format("DONE {} {} output={} bytes={} ratio={} fallback={}",
                           result.index, to_string(result.status),
                           result.output_path, result.compression.output_bytes,
                           ratio_text(result.compression),
                           result.used_fallback ? "yes" : "no"));
  } else {
    write_line(fmt::format("DONE {} {} stage={} reason={}", result.index,
                           to_string(result.status), result.stage,
                           result.message));
  }
}

void EventLogWriter::on_summary(const RunSummary &summary) {
  write_line(fmt::format("SUMMARY seed={} outputs={} succeeded={} failed={} "
                         "cancelled={} cache_hits={} cache_builds={} "
                         "purged={} wall={:.1f}s",
                         summary.run_seed, summary.results.size(),
                         summary.succeeded(), summary.failed(),
                         summary.cancelled(), summary.cache.hits,
                         summary.cache.builds, summary.cache.purged,
                         summary.wall_clock_sec));
}

// **---- ObserverList ----**

void ObserverList::on_phase(const std::string &phase) {
  for (auto *o : observers_)
    o->on_phase(phase);
}

void ObserverList::on_job_progress(int job_index, const std::string &stage,
                                   const std::string &detail) {
  for (auto *o : observers_)
    o->on_job_progress(job_index, stage, detail);
}

void ObserverList::on_job_finished(const JobResult &result) {
  for (auto *o : observers_)
    o->on_job_finished(result);
}

void ObserverList::on_summary(const RunSummary &summary) {
  for (auto *o : observers_)
    o->on_summary(summary);
}

} // namespace clip_mix
