/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup quota-aware CPU limit detection
 *
 *          - Worker count resolution
 *
 *          - Formatting utilities
 */

#include "clip_mix/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace clip_mix {

namespace {

/// Whole CPUs granted by a CFS quota, rounded up; 0 when unlimited
int cpus_from_quota(long quota_us, long period_us) {
  if (quota_us <= 0 || period_us <= 0)
    return 0;
  return static_cast<int>((quota_us + period_us - 1) / period_us);
}

/// cgroup v2 "cpu.max" holds "<quota> <period>" or "max <period>"
int cgroup_v2_cpus() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  std::string quota, period;
  if (!(f >> quota >> period) || quota == "max")
    return 0;
  return cpus_from_quota(std::atol(quota.c_str()), std::atol(period.c_str()));
}

int cgroup_v1_cpus() {
  std::ifstream q("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  std::ifstream p("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  long quota = 0;
  long period = 0;
  if (!(q >> quota) || !(p >> period))
    return 0;
  return cpus_from_quota(quota, period);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  /// A container quota wins over the host's core count
  int limit = cgroup_v2_cpus();
  if (limit <= 0)
    limit = cgroup_v1_cpus();
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  if (limit <= 0)
    return 4;
  return std::min(limit, 64);
}

int calculate_worker_count(int configured, int job_count) {
  int wanted = configured > 0 ? configured : detect_cpu_limit();

  /// No point in idle workers, but always keep one execution path
  wanted = std::min(wanted, std::max(1, job_count));
  return std::max(1, wanted);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_megabytes(std::uintmax_t bytes) {
  return fmt::format("{:.1f} MB", bytes / (1024.0 * 1024.0));
}

std::string short_hash(const std::string &text) {
  std::uint32_t hash = 2166136261u;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 16777619u;
  }
  return fmt::format("{:08x}", hash);
}

} // namespace clip_mix
