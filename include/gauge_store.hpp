#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "metric_key.hpp"

// Last-write-wins float64 gauges.
class GaugeStore {
public:
  void set(const MetricKey& key, double value);
  // nullopt when the gauge was never set (or was reset).
  std::optional<double> get(const MetricKey& key) const;
  std::vector<std::pair<MetricKey, double>> entries() const;
  size_t size() const;
  void clear();

private:
  mutable std::shared_mutex mu_;
  std::unordered_map<MetricKey, std::unique_ptr<std::atomic<double>>, MetricKeyHash> gauges_;
};
