#include "types.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <stdexcept>

void EngineConfig::validate() const {
  if (retention_window.count() <= 0) {
    throw std::invalid_argument("retention window must be positive");
  }
  if (sweep_interval.count() <= 0) {
    throw std::invalid_argument("sweep interval must be positive");
  }
  if (sample_cap == 0) {
    throw std::invalid_argument("sample cap must be at least 1");
  }
  if (thresholds.empty()) {
    throw std::invalid_argument("threshold ladder must not be empty");
  }
  for (size_t i = 0; i < thresholds.size(); ++i) {
    if (!std::isfinite(thresholds[i])) {
      throw std::invalid_argument(
          fmt::format("threshold {} is not finite (+Inf is appended automatically)", i));
    }
    if (i > 0 && thresholds[i] <= thresholds[i - 1]) {
      throw std::invalid_argument(
          fmt::format("threshold ladder must be strictly ascending ({} after {})", thresholds[i],
                      thresholds[i - 1]));
    }
  }
}

const char* to_string(PercentileRule rule) {
  switch (rule) {
    case PercentileRule::FloorIndex:
      return "floor_index";
    case PercentileRule::SmallSampleMax:
      return "small_sample_max";
  }
  return "unknown";
}

bool parse_percentile_rule(const std::string& s, PercentileRule& out) {
  if (s == "floor_index") {
    out = PercentileRule::FloorIndex;
    return true;
  }
  if (s == "small_sample_max") {
    out = PercentileRule::SmallSampleMax;
    return true;
  }
  return false;
}
