#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "metric_key.hpp"

// Monotonic, saturating uint64 counters. Each entry is its own atomic, so concurrent
// increments on different keys only share the map's read lock.
class CounterStore {
public:
  // Returns false (and leaves the counter untouched) when delta is negative.
  bool increment(const MetricKey& key, int64_t delta);
  std::optional<uint64_t> get(const MetricKey& key) const;
  std::vector<std::pair<MetricKey, uint64_t>> entries() const;
  size_t size() const;
  void clear();

private:
  static void saturating_add(std::atomic<uint64_t>& v, uint64_t delta);

  mutable std::shared_mutex mu_;
  std::unordered_map<MetricKey, std::unique_ptr<std::atomic<uint64_t>>, MetricKeyHash> counters_;
};
