/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex
 *
 *          - TimingCollector methods
 */

#include "vedit/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace vedit {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  entries_.push_back({name, us});
}

void TimingCollector::print_summary(const std::string &title) const {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  if (entries_.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=========== TIMING SUMMARY {} ===========\n", title);
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries_) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

long TimingCollector::total_us() const {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  long total = 0;
  for (const auto &e : entries_)
    total += e.microseconds;
  return total;
}

std::vector<TimingEntry> TimingCollector::entries() const {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  return entries_;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex_);
  entries_.clear();
}

} // namespace vedit
