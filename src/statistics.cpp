#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

double percentile_floor_index(const std::vector<double>& sorted, double p) {
  const size_t n = sorted.size();
  auto idx = static_cast<size_t>(std::floor(static_cast<double>(n) * p));
  return sorted[std::min(idx, n - 1)];
}

HistogramSummary summarize(std::vector<double> values, PercentileRule rule) {
  HistogramSummary s;
  s.count = values.size();
  if (values.empty()) return s;

  auto finite_end = std::partition(values.begin(), values.end(),
                                   [](double v) { return std::isfinite(v); });
  values.erase(finite_end, values.end());
  s.non_finite = s.count - values.size();
  if (values.empty()) return s;

  std::sort(values.begin(), values.end());
  const size_t n = values.size();
  const double total = std::accumulate(values.begin(), values.end(), 0.0);

  s.sum = total;
  s.avg = total / static_cast<double>(n);
  s.min = values.front();
  s.max = values.back();
  s.p50 = percentile_floor_index(values, 0.50);
  s.p90 = percentile_floor_index(values, 0.90);
  s.p95 = percentile_floor_index(values, 0.95);
  s.p99 = percentile_floor_index(values, 0.99);

  if (rule == PercentileRule::SmallSampleMax) {
    if (n < 10) s.p90 = values.back();
    if (n < 20) s.p95 = values.back();
    if (n < 100) s.p99 = values.back();
  }
  return s;
}
