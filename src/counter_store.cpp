#include "counter_store.hpp"

#include <spdlog/spdlog.h>

#include <limits>
#include <mutex>

void CounterStore::saturating_add(std::atomic<uint64_t>& v, uint64_t delta) {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  uint64_t cur = v.load(std::memory_order_relaxed);
  uint64_t next;
  do {
    next = (cur > kMax - delta) ? kMax : cur + delta;
  } while (!v.compare_exchange_weak(cur, next, std::memory_order_relaxed));
}

bool CounterStore::increment(const MetricKey& key, int64_t delta) {
  if (delta < 0) {
    spdlog::warn("Rejected negative delta {} for counter {}", delta, key.render());
    return false;
  }
  const auto d = static_cast<uint64_t>(delta);
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = counters_.find(key);
    if (it != counters_.end()) {
      saturating_add(*it->second, d);
      return true;
    }
  }
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto& slot = counters_[key];
  if (!slot) slot = std::make_unique<std::atomic<uint64_t>>(0);
  saturating_add(*slot, d);
  return true;
}

std::optional<uint64_t> CounterStore::get(const MetricKey& key) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = counters_.find(key);
  if (it == counters_.end()) return std::nullopt;
  return it->second->load(std::memory_order_relaxed);
}

std::vector<std::pair<MetricKey, uint64_t>> CounterStore::entries() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::pair<MetricKey, uint64_t>> out;
  out.reserve(counters_.size());
  for (const auto& [key, value] : counters_) {
    out.emplace_back(key, value->load(std::memory_order_relaxed));
  }
  return out;
}

size_t CounterStore::size() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return counters_.size();
}

void CounterStore::clear() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  counters_.clear();
}
