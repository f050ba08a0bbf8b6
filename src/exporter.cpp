#include "exporter.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <ctime>
#include <sstream>

namespace {

template <typename T>
std::map<MetricKey, T> ordered(const std::vector<std::pair<MetricKey, T>>& entries) {
  return {entries.begin(), entries.end()};
}

}  // namespace

std::string format_sample_value(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
  if (v == std::floor(v) && std::abs(v) < 1e15) {
    return fmt::format("{}", static_cast<long long>(v));
  }
  return fmt::format("{}", v);
}

std::string format_bucket_bound(double v) {
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
  if (v == std::floor(v) && std::abs(v) < 1e15) return fmt::format("{:.1f}", v);
  return fmt::format("{}", v);
}

std::string format_iso8601(WallTime t) {
  const std::time_t secs = WallClock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()) %
                  1000;
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                     tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                     static_cast<int>(ms.count()));
}

nlohmann::json to_json(const HistogramSummary& s) {
  nlohmann::json j{{"count", s.count}};
  if (s.non_finite > 0) j["non_finite"] = s.non_finite;
  if (s.sum) j["sum"] = *s.sum;
  if (s.avg) j["avg"] = *s.avg;
  if (s.min) j["min"] = *s.min;
  if (s.max) j["max"] = *s.max;
  if (s.p50) j["p50"] = *s.p50;
  if (s.p90) j["p90"] = *s.p90;
  if (s.p95) j["p95"] = *s.p95;
  if (s.p99) j["p99"] = *s.p99;
  return j;
}

nlohmann::json to_json(const MetricsSnapshot& s) {
  nlohmann::json j;
  j["timestamp"] = format_iso8601(s.timestamp);
  j["uptime_seconds"] = s.uptime_seconds;
  j["window_seconds"] = s.window_seconds;
  j["counters"] = nlohmann::json::object();
  for (const auto& [name, v] : s.counters) j["counters"][name] = v;
  j["gauges"] = nlohmann::json::object();
  for (const auto& [name, v] : s.gauges) j["gauges"][name] = v;
  j["histograms"] = nlohmann::json::object();
  for (const auto& [name, h] : s.histograms) j["histograms"][name] = to_json(h);
  return j;
}

MetricsSnapshot Exporter::snapshot(WallTime now, double uptime_seconds) const {
  MetricsSnapshot s;
  s.timestamp = now;
  s.uptime_seconds = uptime_seconds;
  s.window_seconds = std::chrono::duration<double>(cfg_.retention_window).count();

  for (const auto& [key, v] : counters_.entries()) s.counters[key.render(cfg_.name_prefix)] = v;
  for (const auto& [key, v] : gauges_.entries()) s.gauges[key.render(cfg_.name_prefix)] = v;
  for (auto& b : histograms_.snapshot_values()) {
    s.histograms[b.key.render(cfg_.name_prefix)] =
        summarize(std::move(b.values), cfg_.percentile_rule);
  }
  return s;
}

std::string Exporter::render_text() const {
  std::ostringstream os;
  const std::string& prefix = cfg_.name_prefix;

  std::string last;
  for (const auto& [key, v] : ordered(counters_.entries())) {
    const std::string name = prefix + key.name();
    if (name != last) {
      os << "# TYPE " << name << " counter\n";
      last = name;
    }
    os << name << key.render_labels() << " " << v << "\n";
  }

  last.clear();
  for (const auto& [key, v] : ordered(gauges_.entries())) {
    const std::string name = prefix + key.name();
    if (name != last) {
      os << "# TYPE " << name << " gauge\n";
      last = name;
    }
    os << name << key.render_labels() << " " << format_sample_value(v) << "\n";
  }

  auto buckets = histograms_.snapshot_values();
  std::sort(buckets.begin(), buckets.end(),
            [](const BucketValues& a, const BucketValues& b) { return a.key < b.key; });

  last.clear();
  for (auto& b : buckets) {
    if (b.values.empty()) continue;
    const std::string name = prefix + b.key.name() + "_histogram";
    if (name != last) {
      os << "# TYPE " << name << " histogram\n";
      last = name;
    }
    const std::string labels = b.key.render_labels();
    const size_t total = b.values.size();
    const HistogramSummary stats = summarize(b.values, cfg_.percentile_rule);
    os << name << "_count" << labels << " " << total << "\n";
    os << name << "_sum" << labels << " " << format_sample_value(stats.sum.value_or(0.0)) << "\n";

    // NaN never falls under a finite bound; -Inf always does.
    auto& vals = b.values;
    vals.erase(std::remove_if(vals.begin(), vals.end(), [](double v) { return std::isnan(v); }),
               vals.end());
    std::sort(vals.begin(), vals.end());
    for (double thr : cfg_.thresholds) {
      const auto le = static_cast<size_t>(std::upper_bound(vals.begin(), vals.end(), thr) -
                                          vals.begin());
      os << name << "_bucket" << b.key.render_labels("le", format_bucket_bound(thr)) << " " << le
         << "\n";
    }
    os << name << "_bucket" << b.key.render_labels("le", "+Inf") << " " << total << "\n";
  }
  return os.str();
}
