#include "gauge_store.hpp"

#include <mutex>

void GaugeStore::set(const MetricKey& key, double value) {
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = gauges_.find(key);
    if (it != gauges_.end()) {
      it->second->store(value, std::memory_order_relaxed);
      return;
    }
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto& slot = gauges_[key];
  if (!slot) {
    slot = std::make_unique<std::atomic<double>>(value);
  } else {
    slot->store(value, std::memory_order_relaxed);
  }
}

std::optional<double> GaugeStore::get(const MetricKey& key) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = gauges_.find(key);
  if (it == gauges_.end()) return std::nullopt;
  return it->second->load(std::memory_order_relaxed);
}

std::vector<std::pair<MetricKey, double>> GaugeStore::entries() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::pair<MetricKey, double>> out;
  out.reserve(gauges_.size());
  for (const auto& [key, value] : gauges_) {
    out.emplace_back(key, value->load(std::memory_order_relaxed));
  }
  return out;
}

size_t GaugeStore::size() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return gauges_.size();
}

void GaugeStore::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  gauges_.clear();
}
