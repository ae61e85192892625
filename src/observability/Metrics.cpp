/***
 * Name: spindle::obs::Metrics (impl)
 * Purpose: Timers, counters and their text/JSON renderings.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace spindle::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr uint64_t kLongDialogueInstructions = 100000U;
const std::string kCompilePrefix = "compile.";
} // namespace

static std::string millis(const uint64_t micros) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << static_cast<double>(micros) / kUsPerMs;
  return oss.str();
}

static std::string lowered(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

// `"key": value` members of one JSON object, one per line at `pad` indentation.
template <typename Fmt>
static void appendMembers(std::ostringstream& oss, const std::map<std::string, uint64_t>& values,
                          const std::string& pad, Fmt fmt) {
  bool first = true;
  for (const auto& [key, val] : values) {
    oss << (first ? "\n" : ",\n") << pad << "\"" << fmt.key(key) << "\": " << fmt.value(val);
    first = false;
  }
}

struct DurationFmt {
  std::string key(const std::string& k) const { return lowered(k); }
  std::string value(uint64_t v) const { return millis(v); }
};

struct CounterFmt {
  std::string key(const std::string& k) const { return k; }
  std::string value(uint64_t v) const { return std::to_string(v); }
};

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

uint64_t Metrics::counter(const std::string& key) const {
  auto iter = counters_.find(key);
  return iter == counters_.end() ? 0 : iter->second;
}

uint64_t Metrics::totalMicros(const std::string& prefix) const {
  uint64_t total = 0;
  for (auto it = durations_us_.lower_bound(prefix); it != durations_us_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) { break; }
    total += it->second;
  }
  return total;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    oss << "  " << key << ": " << millis(val) << " ms\n";
  }
  if (totalMicros(kCompilePrefix) > 0) {
    oss << "  compile total: " << millis(totalMicros(kCompilePrefix)) << " ms\n";
  }
  if (geom_) {
    oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << " = " << val << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n  \"durations_ms\": {";
  appendMembers(oss, durations_us_, "    ", DurationFmt{});
  oss << "\n  },\n  \"compile_total_ms\": " << millis(totalMicros(kCompilePrefix));
  if (geom_) {
    oss << ",\n  \"ast\": { \"nodes\": " << geom_->nodes << ", \"max_depth\": " << geom_->maxDepth << " }";
  }
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendMembers(oss, counters_, "    ", CounterFmt{});
    oss << "\n  }";
  }
  const auto hs = hints();
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
  std::vector<std::string> out;
  if (counter("compile.diagnostics") > 0) { out.emplace_back("compile_diagnostics_present"); }
  if (counters_.count("compile.files") != 0 && counter("compile.nodes") == 0) { out.emplace_back("no_nodes"); }
  if (counter("vm.instructions") > kLongDialogueInstructions) { out.emplace_back("long_running_dialogue"); }
  return out;
}

} // namespace spindle::obs
