#include "metrics_engine.hpp"

#include <spdlog/spdlog.h>

#include <utility>

using namespace std::chrono;

namespace {

EngineConfig validated(EngineConfig cfg) {
  cfg.validate();
  return cfg;
}

}  // namespace

MetricsEngine::MetricsEngine(EngineConfig cfg)
    : cfg_(validated(std::move(cfg))),
      started_(Clock::now()),
      histograms_(cfg_.sample_cap),
      retention_(histograms_, cfg_.retention_window, cfg_.sweep_interval),
      exporter_(counters_, gauges_, histograms_, cfg_) {
  spdlog::info("Metrics engine ready: window={}s sweep={}s cap={} rule={} prefix='{}'",
               duration_cast<seconds>(cfg_.retention_window).count(),
               duration_cast<seconds>(cfg_.sweep_interval).count(), cfg_.sample_cap,
               to_string(cfg_.percentile_rule), cfg_.name_prefix);
}

MetricsEngine::~MetricsEngine() { retention_.stop(); }

bool MetricsEngine::increment_counter(const std::string& name, int64_t delta,
                                      const Labels& labels) {
  return counters_.increment(MetricKey::make(name, labels), delta);
}

void MetricsEngine::set_gauge(const std::string& name, double value, const Labels& labels) {
  gauges_.set(MetricKey::make(name, labels), value);
}

void MetricsEngine::record_sample(const std::string& name, double value, const Labels& labels) {
  record_sample_at(name, value, WallClock::now(), labels);
}

void MetricsEngine::record_sample_at(const std::string& name, double value, WallTime timestamp,
                                     const Labels& labels, const Labels& sample_labels) {
  auto key = MetricKey::make(name, labels);
  check_label_names(name, sample_labels);
  histograms_.record(key, Sample{value, timestamp, sample_labels});
}

void MetricsEngine::record_outcome(const std::string& name, bool success,
                                   double processing_time_s, const Labels& labels) {
  const auto ok_key = MetricKey::make(name + "_success_total", labels);
  const auto fail_key = MetricKey::make(name + "_failure_total", labels);
  const auto time_key = MetricKey::make(name + "_processing_time", labels);

  std::lock_guard<std::mutex> g(outcome_mu_);
  counters_.increment(success ? ok_key : fail_key, 1);
  histograms_.record(time_key, Sample{processing_time_s, WallClock::now(), {}});

  const double ok = static_cast<double>(counters_.get(ok_key).value_or(0));
  const double failed = static_cast<double>(counters_.get(fail_key).value_or(0));
  if (ok + failed > 0) {
    gauges_.set(MetricKey::make(name + "_success_rate", labels), ok / (ok + failed));
  }
  const auto stats = ::summarize(histograms_.values(time_key), cfg_.percentile_rule);
  if (stats.avg) gauges_.set(MetricKey::make(name + "_avg_processing_time", labels), *stats.avg);
}

std::optional<uint64_t> MetricsEngine::get_counter(const std::string& name,
                                                   const Labels& labels) const {
  return counters_.get(MetricKey::make(name, labels));
}

std::optional<double> MetricsEngine::get_gauge(const std::string& name,
                                               const Labels& labels) const {
  return gauges_.get(MetricKey::make(name, labels));
}

HistogramSummary MetricsEngine::summarize(const std::string& name, const Labels& labels) const {
  return ::summarize(histograms_.values(MetricKey::make(name, labels)), cfg_.percentile_rule);
}

std::vector<Sample> MetricsEngine::samples(const std::string& name, const Labels& labels) const {
  return histograms_.samples(MetricKey::make(name, labels));
}

MetricsSnapshot MetricsEngine::get_snapshot() {
  const auto now = WallClock::now();
  retention_.sweep_if_due(now);
  return exporter_.snapshot(now, duration<double>(Clock::now() - started_).count());
}

std::string MetricsEngine::render_prometheus_text() {
  retention_.sweep_if_due(WallClock::now());
  return exporter_.render_text();
}

HistogramStore::SweepResult MetricsEngine::sweep(WallTime now) { return retention_.sweep(now); }

void MetricsEngine::start_retention_loop() { retention_.start(); }

void MetricsEngine::start_retention_loop(milliseconds interval) { retention_.start(interval); }

void MetricsEngine::stop_retention_loop() { retention_.stop(); }

void MetricsEngine::reset() {
  counters_.clear();
  gauges_.clear();
  histograms_.clear();
  spdlog::info("Metrics reset");
}
