#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <stdexcept>

namespace {

std::chrono::milliseconds seconds_node(const YAML::Node& n) {
  return std::chrono::milliseconds(static_cast<int64_t>(n.as<double>() * 1000.0));
}

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["engine"]) {
    auto e = y["engine"];
    if (e["retention_window_s"]) c.engine.retention_window = seconds_node(e["retention_window_s"]);
    if (e["sweep_interval_s"]) c.engine.sweep_interval = seconds_node(e["sweep_interval_s"]);
    if (e["sample_cap"]) {
      const auto cap = e["sample_cap"].as<long long>();
      if (cap <= 0) throw std::invalid_argument("engine.sample_cap must be at least 1");
      c.engine.sample_cap = static_cast<size_t>(cap);
    }
    if (e["thresholds"]) {
      c.engine.thresholds.clear();
      for (const auto& t : e["thresholds"]) c.engine.thresholds.push_back(t.as<double>());
    }
    if (e["percentile_rule"]) {
      const auto rule = e["percentile_rule"].as<std::string>();
      if (!parse_percentile_rule(rule, c.engine.percentile_rule)) {
        throw std::invalid_argument("unknown engine.percentile_rule '" + rule + "'");
      }
    }
    if (e["name_prefix"]) c.engine.name_prefix = e["name_prefix"].as<std::string>();
  }

  if (y["logging"]) {
    auto l = y["logging"];
    if (l["level"]) c.log_level = l["level"].as<std::string>();
    if (l["summary_interval_s"]) c.summary_interval_s = l["summary_interval_s"].as<int>();
  }

  if (y["demo"]) {
    auto d = y["demo"];
    if (d["producers"]) c.demo.producers = d["producers"].as<int>();
    if (d["duration_s"]) c.demo.duration_s = d["duration_s"].as<double>();
    if (d["error_rate"]) c.demo.error_rate = d["error_rate"].as<double>();
  }

  if (c.summary_interval_s <= 0) {
    throw std::invalid_argument("logging.summary_interval_s must be positive");
  }
  if (c.demo.producers <= 0) throw std::invalid_argument("demo.producers must be at least 1");
  if (!(c.demo.duration_s > 0.0)) throw std::invalid_argument("demo.duration_s must be positive");
  if (!(c.demo.error_rate >= 0.0 && c.demo.error_rate <= 1.0)) {
    throw std::invalid_argument("demo.error_rate must be within [0, 1]");
  }

  c.engine.validate();
  return c;
}

bool apply_log_level(const std::string& level) {
  if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::warn("Unknown log level '{}', keeping current level", level);
    return false;
  }
  return true;
}
