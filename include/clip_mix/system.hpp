/**
 * @file system.hpp
 * @brief System utilities, CPU detection, and small formatting helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution for the job pool
 *
 *          - Time, size and hash formatting utilities
 */

#ifndef CLIP_MIX_SYSTEM_HPP
#define CLIP_MIX_SYSTEM_HPP

#include <cstdint>
#include <string>

namespace clip_mix {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 * @return Detected CPU limit (capped at 64), or hardware_concurrency() as
 *         fallback
 */
int detect_cpu_limit();

/**
 * @brief Resolve the job pool size.
 *
 * @param configured Requested worker count (0 = auto-detect)
 * @param job_count Number of jobs to run
 * @return Worker count in [1, max(1, job_count)]
 */
int calculate_worker_count(int configured, int job_count);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/// Format a byte count as "12.3 MB"
std::string format_megabytes(std::uintmax_t bytes);

/// 8 hex digit FNV-1a digest of a string
std::string short_hash(const std::string &text);

} // namespace clip_mix

#endif // CLIP_MIX_SYSTEM_HPP
