/***
 * Name: spindle::obs::Metrics
 * Purpose: Collect per-pass timings, tree geometry and counters for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named passes.
 *   - Tree summary values (nodes, depth) and counters recorded by the compiler
 *     and the virtual machine.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   timer names to microseconds; a timer started and stopped repeatedly
 *   accumulates. Timer names are dotted ("compile.check_types"), and the
 *   summaries total the `compile.` group. Formatting is performed on demand;
 *   keys are emitted in sorted order so output is stable.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace spindle::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  uint64_t counter(const std::string& key) const;

  const std::map<std::string, uint64_t>& durationsMicros() const { return durations_us_; }
  // Sum of the timers whose name starts with `prefix` ("compile." for the whole pipeline).
  uint64_t totalMicros(const std::string& prefix) const;

  // Short machine-readable observations derived from the counters.
  std::vector<std::string> hints() const;

  std::string summaryText() const;
  std::string summaryJson() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
};

} // namespace spindle::obs
