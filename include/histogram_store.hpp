#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "metric_key.hpp"
#include "types.hpp"

// Bounded FIFO of samples for one series. Every method holds the bucket mutex for its
// whole body, so readers always see a consistent copy.
class HistogramBucket {
public:
  explicit HistogramBucket(size_t cap) : cap_(cap) {}

  void add(Sample s) {
    std::lock_guard<std::mutex> g(mu_);
    if (!samples_.empty() && s.timestamp < samples_.back().timestamp) in_order_ = false;
    if (samples_.size() == cap_) samples_.pop_front();
    samples_.push_back(std::move(s));
  }

  // Drops every sample with timestamp < cutoff. Returns the number removed.
  size_t trim_older_than(WallTime cutoff);

  std::vector<double> values() const {
    std::lock_guard<std::mutex> g(mu_);
    std::vector<double> v;
    v.reserve(samples_.size());
    for (const auto& s : samples_) v.push_back(s.value);
    return v;
  }

  std::vector<Sample> samples() const {
    std::lock_guard<std::mutex> g(mu_);
    return {samples_.begin(), samples_.end()};
  }

  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return samples_.size();
  }

  size_t capacity() const { return cap_; }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<Sample> samples_;
  bool in_order_{true};  // false once a late sample was appended
};

struct BucketValues {
  MetricKey key;
  std::vector<double> values;
};

class HistogramStore {
public:
  explicit HistogramStore(size_t sample_cap = 1000) : sample_cap_(sample_cap) {}

  void record(const MetricKey& key, Sample sample);

  // One tear-free copy per bucket; buckets are copied one at a time.
  std::vector<BucketValues> snapshot_values() const;
  std::vector<double> values(const MetricKey& key) const;
  std::vector<Sample> samples(const MetricKey& key) const;

  struct SweepResult {
    size_t buckets_visited{0};
    size_t samples_removed{0};
  };
  // Trims each bucket under its own lock; the map lock is only held to list buckets.
  SweepResult sweep(WallTime cutoff);

  size_t bucket_count() const;
  void clear();

private:
  std::shared_ptr<HistogramBucket> find(const MetricKey& key) const;

  size_t sample_cap_;
  mutable std::shared_mutex mu_;
  std::unordered_map<MetricKey, std::shared_ptr<HistogramBucket>, MetricKeyHash> buckets_;
};
