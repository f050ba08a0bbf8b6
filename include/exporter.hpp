#pragma once
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

#include "counter_store.hpp"
#include "gauge_store.hpp"
#include "histogram_store.hpp"
#include "statistics.hpp"
#include "types.hpp"

// Point-in-time view of every series, keyed by the rendered series name
// (`<prefix><name>{labels}`). Each entry is tear-free; the set as a whole is not atomic.
struct MetricsSnapshot {
  WallTime timestamp{};
  double uptime_seconds{0};
  double window_seconds{0};
  std::map<std::string, uint64_t> counters;
  std::map<std::string, double> gauges;
  std::map<std::string, HistogramSummary> histograms;
};

nlohmann::json to_json(const HistogramSummary& s);
nlohmann::json to_json(const MetricsSnapshot& s);

std::string format_iso8601(WallTime t);
// Prometheus sample value: NaN, +Inf, -Inf or the shortest round-trip decimal.
std::string format_sample_value(double v);
// `le` values keep one decimal for whole bounds: 1.0, 10.0, 0.25.
std::string format_bucket_bound(double v);

class Exporter {
public:
  Exporter(const CounterStore& counters, const GaugeStore& gauges,
           const HistogramStore& histograms, const EngineConfig& cfg)
      : counters_(counters), gauges_(gauges), histograms_(histograms), cfg_(cfg) {}

  MetricsSnapshot snapshot(WallTime now, double uptime_seconds) const;

  // Text exposition format 0.0.4. Histograms with no samples are omitted.
  std::string render_text() const;

  static constexpr const char* kContentType = "text/plain; version=0.0.4";

private:
  const CounterStore& counters_;
  const GaugeStore& gauges_;
  const HistogramStore& histograms_;
  const EngineConfig& cfg_;
};
