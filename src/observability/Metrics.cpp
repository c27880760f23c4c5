/***
 * Name: tether::obs::Metrics (impl)
 * Purpose: Implement timing, counters and formatting.
 */
#include "tether/observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace tether::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kHighHeapPeakBytes = 64ULL * 1024ULL * 1024ULL;
} // namespace

static std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << "\n  }";
}

static void appendKeyValueObject(std::ostringstream& oss,
                                 const std::map<std::string, uint64_t>& values,
                                 int indent) {
  const std::string pad(indent, ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void Metrics::start(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mu_);
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  const std::lock_guard<std::mutex> lock(mu_);
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

void Metrics::incCounter(const std::string& key, uint64_t delta) {
  const std::lock_guard<std::mutex> lock(mu_);
  counters_[key] += delta;
}

void Metrics::setCounter(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mu_);
  counters_[key] = value;
}

void Metrics::setGauge(const std::string& key, uint64_t value) {
  const std::lock_guard<std::mutex> lock(mu_);
  gauges_[key] = value;
}

uint64_t Metrics::counter(const std::string& key) const {
  const std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(key);
  return it == counters_.end() ? 0U : it->second;
}

std::map<std::string, uint64_t> Metrics::counters() const {
  const std::lock_guard<std::mutex> lock(mu_);
  return counters_;
}

std::map<std::string, uint64_t> Metrics::gauges() const {
  const std::lock_guard<std::mutex> lock(mu_);
  return gauges_;
}

std::string Metrics::summaryText() const {
  const std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  for (const auto& [key, val] : counters_) { oss << "  " << key << ": " << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << ": " << val << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  const std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  if (!gauges_.empty()) {
    oss << ",\n  \"gauges\": {";
    appendKeyValueObject(oss, gauges_, kIndent4);
    oss << "\n  }";
  }
  auto hs = hintsLocked();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) oss << ", ";
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  const std::lock_guard<std::mutex> lock(mu_);
  return hintsLocked();
}

std::vector<std::string> Metrics::hintsLocked() const {
  std::vector<std::string> out;
  auto itFailed = counters_.find(kTasksFailed);
  if (itFailed != counters_.end() && itFailed->second > 0) { out.emplace_back("task_failures_present"); }
  auto itCancelled = counters_.find(kTasksCancelled);
  if (itCancelled != counters_.end() && itCancelled->second > 0) { out.emplace_back("task_cancellations_present"); }
  auto itPeak = gauges_.find("gc.peak_bytes_live");
  if (itPeak != gauges_.end() && itPeak->second > kHighHeapPeakBytes) { out.emplace_back("high_heap_peak"); }
  return out;
}

} // namespace tether::obs
