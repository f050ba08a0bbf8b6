#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "counter_store.hpp"
#include "exporter.hpp"
#include "gauge_store.hpp"
#include "histogram_store.hpp"
#include "retention.hpp"
#include "statistics.hpp"
#include "types.hpp"

// One engine per process (or per test), passed by reference to producers and readers.
// All ingestion calls are thread-safe and never block on I/O. Invalid names or labels
// throw std::invalid_argument before anything is stored.
class MetricsEngine {
public:
  explicit MetricsEngine(EngineConfig cfg = {});
  ~MetricsEngine();

  MetricsEngine(const MetricsEngine&) = delete;
  MetricsEngine& operator=(const MetricsEngine&) = delete;

  // Ingestion
  bool increment_counter(const std::string& name, int64_t delta = 1, const Labels& labels = {});
  void set_gauge(const std::string& name, double value, const Labels& labels = {});
  void record_sample(const std::string& name, double value, const Labels& labels = {});
  void record_sample_at(const std::string& name, double value, WallTime timestamp,
                        const Labels& labels = {}, const Labels& sample_labels = {});

  // Success/failure counters, processing-time histogram, and the derived
  // <name>_success_rate / <name>_avg_processing_time gauges. Outcome updates are
  // serialized so the last gauge write always reflects every recorded outcome.
  void record_outcome(const std::string& name, bool success, double processing_time_s,
                      const Labels& labels = {});

  // Queries
  std::optional<uint64_t> get_counter(const std::string& name, const Labels& labels = {}) const;
  std::optional<double> get_gauge(const std::string& name, const Labels& labels = {}) const;
  HistogramSummary summarize(const std::string& name, const Labels& labels = {}) const;
  std::vector<Sample> samples(const std::string& name, const Labels& labels = {}) const;

  // Export; both run a retention sweep first when one is due.
  MetricsSnapshot get_snapshot();
  std::string render_prometheus_text();

  // Lifecycle
  HistogramStore::SweepResult sweep(WallTime now = WallClock::now());
  void start_retention_loop();
  void start_retention_loop(std::chrono::milliseconds interval);
  void stop_retention_loop();
  bool retention_running() const { return retention_.running(); }
  void reset();  // test isolation only

  const EngineConfig& config() const { return cfg_; }

private:
  EngineConfig cfg_;
  TimePoint started_;
  CounterStore counters_;
  GaugeStore gauges_;
  HistogramStore histograms_;
  RetentionManager retention_;
  Exporter exporter_;
  std::mutex outcome_mu_;
};
