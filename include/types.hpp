#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// Sample timestamps and the retention cutoff are wall-clock instants.
using WallClock = std::chrono::system_clock;
using WallTime = std::chrono::time_point<WallClock>;

// Label mapping as handed in by producers. Insertion order never matters.
using Labels = std::unordered_map<std::string, std::string>;

struct Sample {
  double value{0};
  WallTime timestamp{};
  Labels labels;  // per-sample attribution, e.g. map_id
};

enum class PercentileRule {
  FloorIndex,      // sorted[min(floor(n * p), n - 1)]
  SmallSampleMax,  // FloorIndex, but p90/p95/p99 report max below 10/20/100 samples
};

struct EngineConfig {
  std::chrono::milliseconds retention_window{std::chrono::hours(24)};
  std::chrono::milliseconds sweep_interval{std::chrono::hours(1)};
  size_t sample_cap{1000};
  std::vector<double> thresholds{0.1, 0.5, 1.0, 2.0, 5.0, 10.0};  // +Inf appended at export
  PercentileRule percentile_rule{PercentileRule::FloorIndex};
  std::string name_prefix;

  // Throws std::invalid_argument describing the first bad field.
  void validate() const;
};

const char* to_string(PercentileRule rule);
bool parse_percentile_rule(const std::string& s, PercentileRule& out);
