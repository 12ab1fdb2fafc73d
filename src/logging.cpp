/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 */

#include "shortsmith/logging.hpp"

namespace shortsmith {

std::mutex log_mutex;

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== STAGE TIMINGS ==================\n");
  fmt::print("{:<30} {:>20}\n", "Stage", "Time (ms) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double ms = e.microseconds / 1000.0;
    fmt::print("{:<30} {:>10.1f} [{:.2f}s]\n", e.name, ms, ms / 1000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

} // namespace shortsmith
