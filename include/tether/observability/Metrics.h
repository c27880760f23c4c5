/***
 * Name: tether::obs::Metrics
 * Purpose: Collect named timings, task counters and runtime gauges for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Counter increments from the async runtime and the pool (tasks.*).
 *   - Gauges set from collector statistics (gc.*).
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Counters are updated from runtime
 *   threads, so every member is guarded by one mutex and readers get copies. Formatting is
 *   performed on demand; keys are emitted in sorted order.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tether::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void incCounter(const std::string& key, uint64_t delta = 1);
  void setCounter(const std::string& key, uint64_t value);
  void setGauge(const std::string& key, uint64_t value);

  uint64_t counter(const std::string& key) const;
  std::map<std::string, uint64_t> counters() const;
  std::map<std::string, uint64_t> gauges() const;

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::vector<std::string> hintsLocked() const;

  mutable std::mutex mu_;
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

// Counter keys recorded by the task dispatch layer.
inline constexpr const char* kTasksDispatched = "tasks.dispatched";
inline constexpr const char* kTasksCompleted = "tasks.completed";
inline constexpr const char* kTasksFailed = "tasks.failed";
inline constexpr const char* kTasksCancelled = "tasks.cancelled";

} // namespace tether::obs
