#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "types.hpp"

// Fields other than count are absent when the bucket holds no finite sample.
struct HistogramSummary {
  size_t count{0};
  size_t non_finite{0};  // NaN / +-Inf samples, included in count only
  std::optional<double> sum, avg, min, max;
  std::optional<double> p50, p90, p95, p99;

  bool empty() const { return count == 0; }
};

// `sorted` must be ascending and non-empty. Returns sorted[min(floor(n * p), n - 1)].
double percentile_floor_index(const std::vector<double>& sorted, double p);

// Works on its own copy of the values; the caller's order is never touched.
HistogramSummary summarize(std::vector<double> values,
                           PercentileRule rule = PercentileRule::FloorIndex);
