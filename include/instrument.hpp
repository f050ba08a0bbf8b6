#pragma once
#include <string>
#include <utility>

#include "metrics_engine.hpp"
#include "types.hpp"

// Records the scope's elapsed seconds under <name>_processing_time when destroyed.
// Leaving the scope through an exception, or calling mark_failed(), also bumps
// <name>_error_total. The timer only observes; it never touches the exception.
class ScopedTimer {
public:
  ScopedTimer(MetricsEngine& engine, std::string name, Labels labels = {});
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer&) = delete;
  ScopedTimer& operator=(const ScopedTimer&) = delete;

  // For operations that report failure through a return value instead of throwing.
  void mark_failed() { failed_ = true; }
  double elapsed_seconds() const;

private:
  MetricsEngine& engine_;
  std::string name_;
  Labels labels_;
  TimePoint start_;
  int uncaught_on_entry_;
  bool failed_{false};
};

// Runs fn() under a ScopedTimer and hands back its result (or exception) unchanged.
template <typename Fn>
decltype(auto) instrument(MetricsEngine& engine, const std::string& name, Fn&& fn) {
  ScopedTimer timer(engine, name);
  return std::forward<Fn>(fn)();
}

template <typename Fn>
decltype(auto) instrument(MetricsEngine& engine, const std::string& name, const Labels& labels,
                          Fn&& fn) {
  ScopedTimer timer(engine, name, labels);
  return std::forward<Fn>(fn)();
}
