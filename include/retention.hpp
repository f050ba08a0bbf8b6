#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "histogram_store.hpp"
#include "types.hpp"

class RetentionManager {
public:
  RetentionManager(HistogramStore& store, std::chrono::milliseconds window,
                   std::chrono::milliseconds interval);
  ~RetentionManager();

  RetentionManager(const RetentionManager&) = delete;
  RetentionManager& operator=(const RetentionManager&) = delete;

  // Removes samples older than now - window (a sample exactly at the cutoff is kept).
  HistogramStore::SweepResult sweep(WallTime now);
  // Sweeps only if a full interval elapsed since the last sweep. Returns true if it swept.
  bool sweep_if_due(WallTime now);

  void start();                                 // Background loop at the configured interval
  void start(std::chrono::milliseconds interval);
  void stop();                                  // Idempotent; joins the loop thread
  bool running() const { return running_.load(); }

  std::chrono::milliseconds window() const { return window_; }
  std::chrono::milliseconds interval() const;
  WallTime last_sweep() const { return WallTime(WallClock::duration(last_sweep_.load())); }

private:
  void loop(std::chrono::milliseconds interval);

  HistogramStore& store_;
  const std::chrono::milliseconds window_;
  std::atomic<int64_t> interval_ms_;
  std::atomic<WallClock::rep> last_sweep_;

  std::mutex lifecycle_mu_;  // serializes start/stop
  std::atomic<bool> running_{false};
  std::mutex cv_mu_;
  std::condition_variable cv_;
  std::thread loop_thread_;
};
