#include "retention.hpp"

#include <spdlog/spdlog.h>

using namespace std::chrono;

RetentionManager::RetentionManager(HistogramStore& store, milliseconds window,
                                   milliseconds interval)
    : store_(store),
      window_(window),
      interval_ms_(interval.count()),
      last_sweep_(WallClock::now().time_since_epoch().count()) {}

RetentionManager::~RetentionManager() { stop(); }

milliseconds RetentionManager::interval() const { return milliseconds(interval_ms_.load()); }

HistogramStore::SweepResult RetentionManager::sweep(WallTime now) {
  const WallTime cutoff = now - window_;
  auto t0 = Clock::now();
  auto r = store_.sweep(cutoff);
  last_sweep_.store(now.time_since_epoch().count());
  spdlog::debug("Retention sweep: removed {} samples across {} buckets in {:.3f}ms",
                r.samples_removed, r.buckets_visited,
                duration<double, std::milli>(Clock::now() - t0).count());
  return r;
}

bool RetentionManager::sweep_if_due(WallTime now) {
  auto last = last_sweep_.load();
  const WallTime last_tp{WallClock::duration(last)};
  if (now - last_tp < interval()) return false;
  // Only one caller claims a due sweep.
  if (!last_sweep_.compare_exchange_strong(last, now.time_since_epoch().count())) return false;
  sweep(now);
  return true;
}

void RetentionManager::start() { start(interval()); }

void RetentionManager::start(milliseconds interval) {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (running_.load()) return;
  interval_ms_.store(interval.count());
  running_ = true;
  loop_thread_ = std::thread([this, interval] { loop(interval); });
  spdlog::info("Retention loop started (window {}s, interval {}ms)",
               duration_cast<seconds>(window_).count(), interval.count());
}

void RetentionManager::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> g(cv_mu_);
    if (!running_.exchange(false)) return;
  }
  cv_.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();
  spdlog::info("Retention loop stopped");
}

void RetentionManager::loop(milliseconds interval) {
  std::unique_lock<std::mutex> lk(cv_mu_);
  while (running_) {
    if (cv_.wait_for(lk, interval, [this] { return !running_; })) break;
    lk.unlock();
    sweep(WallClock::now());
    lk.lock();
  }
}
