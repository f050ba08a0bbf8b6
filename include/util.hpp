#pragma once
#include <string>

#include "types.hpp"

struct DemoConfig {
  int producers{4};
  double duration_s{3.0};
  double error_rate{0.05};
};

struct AppConfig {
  EngineConfig engine;
  std::string log_level{"info"};
  int summary_interval_s{5};
  DemoConfig demo;
};

// YAML errors propagate as YAML::Exception; invalid values throw std::invalid_argument.
AppConfig load_config(const std::string& path);

// debug|info|warn|error. Returns false (level unchanged) for anything else.
bool apply_log_level(const std::string& level);
