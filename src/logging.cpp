/**
 * @file logging.cpp
 * @brief Log mutex and phase timing storage
 */

#include "term_reel/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace term_reel {

std::mutex log_mutex;

// **----- PHASE TIMINGS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

namespace {

struct PhaseRow {
  std::string name;
  size_t runs = 0;
  long total_us = 0;
  long slowest_us = 0;
};

std::vector<PhaseRow> fold_by_phase(const std::vector<TimingEntry> &entries) {
  std::vector<PhaseRow> rows;
  for (const auto &e : entries) {
    auto it = std::find_if(rows.begin(), rows.end(),
                           [&e](const PhaseRow &r) { return r.name == e.name; });
    if (it == rows.end()) {
      rows.push_back(PhaseRow{e.name});
      it = rows.end() - 1;
    }
    ++it->runs;
    it->total_us += e.microseconds;
    it->slowest_us = std::max(it->slowest_us, e.microseconds);
  }
  return rows;
}

} // namespace

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::vector<PhaseRow> rows;
  {
    std::lock_guard<std::mutex> lock(timing_mutex);
    rows = fold_by_phase(entries);
  }
  if (rows.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print(stderr, fg(fmt::color::cyan), "\n-- phase timings --\n");
  fmt::print(stderr, "{:<16} {:>6} {:>12} {:>12}\n", "phase", "runs",
             "total ms", "slowest ms");
  for (const auto &r : rows) {
    fmt::print(stderr, "{:<16} {:>6} {:>12.2f} {:>12.2f}\n", r.name, r.runs,
               r.total_us / 1000.0, r.slowest_us / 1000.0);
  }
  std::fflush(stderr);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

} // namespace term_reel
