/**
 * @file job_queue.cpp
 * @brief Thread-safe job queue and result collection implementation
 */

#include "clip_mix/job_queue.hpp"

#include <algorithm>
#include <utility>

namespace clip_mix {

// **----- JobQueue Implementation -----**

void JobQueue::push(size_t job) {
  std::lock_guard<std::mutex> lock(mutex);
  jobs.push(job);
  cv.notify_one();
}

bool JobQueue::pop(size_t &job) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !jobs.empty() || done.load(); });
  if (jobs.empty())
    return false;
  job = jobs.front();
  jobs.pop();
  return true;
}

std::vector<size_t> JobQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<size_t> left;
  while (!jobs.empty()) {
    left.push_back(jobs.front());
    jobs.pop();
  }
  return left;
}

void JobQueue::finish() {
  done.store(true);
  cv.notify_all();
}

// **----- ResultCollector Implementation -----**

void ResultCollector::reserve(size_t n) {
  std::lock_guard<std::mutex> lock(mutex);
  results.reserve(n);
}

void ResultCollector::add(JobResult &&result) {
  std::lock_guard<std::mutex> lock(mutex);
  results.push_back(std::move(result));
}

std::vector<JobResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  std::vector<JobResult> out = std::move(results);
  results.clear();
  std::sort(out.begin(), out.end(),
            [](const JobResult &a, const JobResult &b) { return a.index < b.index; });
  return out;
}

} // namespace clip_mix
