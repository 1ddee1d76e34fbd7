// Worker pool: ordering, concurrency bound, failure isolation, cancellation.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "clip_mix/job_scheduler.hpp"

namespace clip_mix {
namespace {

std::vector<OutputJob> make_jobs(int n) {
  std::vector<OutputJob> jobs;
  for (int i = 1; i <= n; ++i) {
    OutputJob job;
    job.index = i;
    job.seed = static_cast<std::uint64_t>(i);
    jobs.push_back(job);
  }
  return jobs;
}

JobResult succeed(const OutputJob &job) {
  JobResult r;
  r.index = job.index;
  r.status = JobStatus::Succeeded;
  r.output_path = "out_" + std::to_string(job.index) + ".mp4";
  return r;
}

/// Counts finished events from the worker threads
class CountingObserver : public RunObserver {
public:
  void on_job_finished(const JobResult &result) override {
    std::lock_guard<std::mutex> lock(mutex_);
    finished.push_back(result.index);
  }

  std::vector<int> finished;

private:
  std::mutex mutex_;
};

TEST(JobSchedulerTest, ResultsComeBackInIndexOrder) {
  CountingObserver observer;
  JobScheduler scheduler(
      [](const OutputJob &job) {
        /// Later jobs finish first
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (6 - job.index)));
        return succeed(job);
      },
      observer);

  auto results = scheduler.run(make_jobs(5), 5);

  ASSERT_EQ(results.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(results[static_cast<size_t>(i)].index, i + 1);
    EXPECT_TRUE(results[static_cast<size_t>(i)].ok());
  }
  EXPECT_EQ(observer.finished.size(), 5u);
}

TEST(JobSchedulerTest, NeverRunsMoreJobsThanWorkers) {
  RunObserver observer;
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  JobScheduler scheduler(
      [&](const OutputJob &job) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        --running;
        return succeed(job);
      },
      observer);

  auto results = scheduler.run(make_jobs(8), 3);

  EXPECT_EQ(results.size(), 8u);
  EXPECT_EQ(scheduler.workers(), 3);
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 1);
}

TEST(JobSchedulerTest, PoolIsClampedToJobCount) {
  RunObserver observer;
  JobScheduler scheduler(succeed, observer);

  scheduler.run(make_jobs(2), 16);
  EXPECT_EQ(scheduler.workers(), 2);

  JobScheduler single(succeed, observer);
  single.run(make_jobs(3), 0);
  EXPECT_EQ(single.workers(), 1);
}

TEST(JobSchedulerTest, ThrowingJobFailsAloneAndOthersFinish) {
  RunObserver observer;
  JobScheduler scheduler(
      [](const OutputJob &job) -> JobResult {
        if (job.index == 2)
          throw std::runtime_error("disk full");
        return succeed(job);
      },
      observer);

  auto results = scheduler.run(make_jobs(4), 2);

  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[1].status, JobStatus::Failed);
  EXPECT_EQ(results[1].index, 2);
  EXPECT_EQ(results[1].stage, "job");
  EXPECT_EQ(results[1].message, "disk full");
  EXPECT_TRUE(results[0].ok());
  EXPECT_TRUE(results[2].ok());
  EXPECT_TRUE(results[3].ok());
}

TEST(JobSchedulerTest, CancelledBeforeStartDispatchesNothing) {
  CountingObserver observer;
  std::atomic<bool> cancel{true};
  std::atomic<int> ran{0};
  JobScheduler scheduler(
      [&](const OutputJob &job) {
        ++ran;
        return succeed(job);
      },
      observer, &cancel);

  auto results = scheduler.run(make_jobs(3), 2);

  EXPECT_EQ(ran.load(), 0);
  ASSERT_EQ(results.size(), 3u);
  for (const auto &r : results) {
    EXPECT_EQ(r.status, JobStatus::Cancelled);
    EXPECT_EQ(r.stage, "dispatch");
  }
  EXPECT_EQ(observer.finished.size(), 3u);
}

TEST(JobSchedulerTest, CancellationStopsFurtherDispatch) {
  RunObserver observer;
  std::atomic<bool> cancel{false};
  JobScheduler scheduler(
      [&](const OutputJob &job) {
        cancel.store(true);
        return succeed(job);
      },
      observer, &cancel);

  auto results = scheduler.run(make_jobs(4), 1);

  ASSERT_EQ(results.size(), 4u);
  EXPECT_TRUE(results[0].ok());
  for (size_t i = 1; i < results.size(); ++i) {
    EXPECT_EQ(results[i].status, JobStatus::Cancelled);
    EXPECT_EQ(results[i].index, static_cast<int>(i) + 1);
  }
}

} // namespace
} // namespace clip_mix
