/***
 * Name: pytdc::obs::Metrics
 * Purpose: Collect simple per-stage timings and declaration counts for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named stages (Lex, Parse, Build, Validate).
 *   - Counters and gauges recorded by the parse entry point.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to microseconds; a stage timed once per input accumulates.
 *   Counters accumulate the same way, so one instance can summarize a run
 *   over several inputs. One instance belongs to one caller; the
 *   parse entry point only records into it when handed one. Formatting is
 *   performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pytdc::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  std::string summaryText() const;
  std::string summaryJson() const;

  // Derived one-word observations for tooling, e.g. "parse_failed"
  std::vector<std::string> hints() const;

  const std::map<std::string, uint64_t>& durations() const { return durations_us_; }

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};

 public:
  // Generic counters/gauges for observability
  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
};

// Times one stage for the lifetime of the object; a null sink records nothing
class ScopedStage {
 public:
  ScopedStage(Metrics* metrics, std::string stage) : metrics_(metrics), stage_(std::move(stage)) {
    if (metrics_ != nullptr) { metrics_->start(stage_); }
  }
  ~ScopedStage() {
    if (metrics_ != nullptr) { metrics_->stop(stage_); }
  }
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

 private:
  Metrics* metrics_;
  std::string stage_;
};

} // namespace pytdc::obs
