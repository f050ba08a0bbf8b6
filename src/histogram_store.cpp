#include "histogram_store.hpp"

#include <algorithm>

size_t HistogramBucket::trim_older_than(WallTime cutoff) {
  std::lock_guard<std::mutex> g(mu_);
  const size_t before = samples_.size();
  while (!samples_.empty() && samples_.front().timestamp < cutoff) samples_.pop_front();
  if (!in_order_) {
    samples_.erase(std::remove_if(samples_.begin(), samples_.end(),
                                  [cutoff](const Sample& s) { return s.timestamp < cutoff; }),
                   samples_.end());
  }
  if (samples_.empty()) in_order_ = true;
  return before - samples_.size();
}

std::shared_ptr<HistogramBucket> HistogramStore::find(const MetricKey& key) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = buckets_.find(key);
  return it == buckets_.end() ? nullptr : it->second;
}

void HistogramStore::record(const MetricKey& key, Sample sample) {
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
      it->second->add(std::move(sample));
      return;
    }
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto& slot = buckets_[key];
  if (!slot) slot = std::make_shared<HistogramBucket>(sample_cap_);
  slot->add(std::move(sample));
}

std::vector<BucketValues> HistogramStore::snapshot_values() const {
  std::vector<std::pair<MetricKey, std::shared_ptr<HistogramBucket>>> list;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    list.assign(buckets_.begin(), buckets_.end());
  }
  std::vector<BucketValues> out;
  out.reserve(list.size());
  for (const auto& [key, bucket] : list) out.push_back({key, bucket->values()});
  return out;
}

std::vector<double> HistogramStore::values(const MetricKey& key) const {
  auto bucket = find(key);
  return bucket ? bucket->values() : std::vector<double>{};
}

std::vector<Sample> HistogramStore::samples(const MetricKey& key) const {
  auto bucket = find(key);
  return bucket ? bucket->samples() : std::vector<Sample>{};
}

HistogramStore::SweepResult HistogramStore::sweep(WallTime cutoff) {
  std::vector<std::shared_ptr<HistogramBucket>> list;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    list.reserve(buckets_.size());
    for (const auto& kv : buckets_) list.push_back(kv.second);
  }
  SweepResult r;
  for (const auto& bucket : list) {
    r.samples_removed += bucket->trim_older_than(cutoff);
    r.buckets_visited++;
  }
  return r;
}

size_t HistogramStore::bucket_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return buckets_.size();
}

void HistogramStore::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  buckets_.clear();
}
