/**
 * @file system.hpp
 * @brief System utilities, CPU detection, identifiers and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Worker count resolution for export and segment workers
 *
 *          - Job identifiers and ISO-8601 timestamps
 *
 *          - Time formatting utilities
 */

#ifndef VEDIT_SYSTEM_HPP
#define VEDIT_SYSTEM_HPP

#include <string>

namespace vedit {

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
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured worker count.
 * @param configured Requested workers (0 = auto)
 * @return configured clamped to [1, cpu limit]; the cpu limit when 0
 */
int resolve_worker_count(int configured);

// **---- Identifiers ----**

/// Random RFC 4122 version-4 identifier
std::string make_job_id();

/// First 8 characters of a job id, used in log prefixes
std::string short_id(const std::string &job_id);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso_utc_now();

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace vedit

#endif // VEDIT_SYSTEM_HPP
