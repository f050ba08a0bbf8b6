#include "instrument.hpp"

#include <spdlog/spdlog.h>

#include <exception>

ScopedTimer::ScopedTimer(MetricsEngine& engine, std::string name, Labels labels)
    : engine_(engine),
      name_(std::move(name)),
      labels_(std::move(labels)),
      start_(Clock::now()),
      uncaught_on_entry_(std::uncaught_exceptions()) {}

double ScopedTimer::elapsed_seconds() const {
  return std::chrono::duration<double>(Clock::now() - start_).count();
}

ScopedTimer::~ScopedTimer() {
  const double elapsed = elapsed_seconds();
  const bool failed = failed_ || std::uncaught_exceptions() > uncaught_on_entry_;
  // Never throw from here; a producer exception may be in flight.
  try {
    engine_.record_sample(name_ + "_processing_time", elapsed, labels_);
    if (failed) engine_.increment_counter(name_ + "_error_total", 1, labels_);
  } catch (const std::exception& e) {
    spdlog::error("Failed to record timing for '{}': {}", name_, e.what());
  }
}
