/***
 * Name: pytdc::obs::Metrics (impl)
 * Purpose: Stage timing and summary formatting.
 */
#include "observability/Metrics.h"
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace pytdc::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kLargeTokenCount = 100000U;
constexpr std::array<const char*, 4> kPipeline{"Lex", "Parse", "Build", "Validate"};

std::string lowerCopy(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](char chr) { return (chr >= 'A' && chr <= 'Z') ? static_cast<char>(chr - 'A' + 'a') : chr; });
  return text;
}

std::string millis(uint64_t micros) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << (static_cast<double>(micros) / kUsPerMs);
  return oss.str();
}

// Pipeline stages in execution order, then any other timed names by key
std::vector<std::pair<std::string, uint64_t>> ordered(const std::map<std::string, uint64_t>& durations) {
  std::vector<std::pair<std::string, uint64_t>> out;
  for (const char* stage : kPipeline) {
    const auto it = durations.find(stage);
    if (it != durations.end()) { out.emplace_back(*it); }
  }
  for (const auto& entry : durations) {
    if (std::find(kPipeline.begin(), kPipeline.end(), entry.first) == kPipeline.end()) { out.emplace_back(entry); }
  }
  return out;
}

uint64_t total(const std::map<std::string, uint64_t>& durations) {
  uint64_t sum = 0;
  for (const auto& [key, val] : durations) { sum += val; }
  return sum;
}

void appendObject(std::ostringstream& oss, const char* title, const std::map<std::string, uint64_t>& values) {
  if (values.empty()) { return; }
  const std::string pad(kIndent4, ' ');
  oss << ",\n  \"" << title << "\": {";
  bool first = true;
  for (const auto& [key, val] : values) {
    oss << (first ? "" : ",") << "\n" << pad << "\"" << key << "\": " << val;
    first = false;
  }
  oss << "\n  }";
}
} // namespace

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

// Repeated stages (one per input) accumulate
void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [stage, micros] : ordered(durations_us_)) { oss << "  " << stage << ": " << millis(micros) << " ms\n"; }
  if (!durations_us_.empty()) { oss << "  total: " << millis(total(durations_us_)) << " ms\n"; }
  for (const auto& [key, val] : counters_) { oss << "  " << key << "=" << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << "=" << val << "\n"; }
  const auto hs = hints();
  if (!hs.empty()) {
    oss << "  hints:";
    for (const auto& hint : hs) { oss << " " << hint; }
    oss << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n  \"durations_ms\": {";
  bool first = true;
  for (const auto& [stage, micros] : ordered(durations_us_)) {
    // JSON uses lowercase stage keys
    oss << (first ? "" : ",") << "\n    \"" << lowerCopy(stage) << "\": " << millis(micros);
    first = false;
  }
  if (!durations_us_.empty()) { oss << ",\n    \"total\": " << millis(total(durations_us_)); }
  oss << "\n  }";
  appendObject(oss, "counters", counters_);
  appendObject(oss, "gauges", gauges_);
  const auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) { oss << (i == 0 ? "" : ", ") << "\"" << hs[i] << "\""; }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  auto itOk = gauges_.find("parse.ok");
  if (itOk != gauges_.end() && itOk->second == 0U) { out.emplace_back("parse_failed"); }
  auto itTokens = counters_.find("lex.tokens");
  if (itTokens != counters_.end() && itTokens->second > kLargeTokenCount) { out.emplace_back("large_input"); }
  return out;
}

} // namespace pytdc::obs
