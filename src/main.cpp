#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "instrument.hpp"
#include "metrics_engine.hpp"
#include "util.hpp"

using namespace std::chrono;

namespace {

// Stand-in for a request handler: a few ms of work that sometimes fails.
void simulated_request(std::mt19937& rng, double error_rate) {
  std::uniform_int_distribution<int> work_ms(1, 8);
  std::uniform_real_distribution<double> coin(0.0, 1.0);
  std::this_thread::sleep_for(milliseconds(work_ms(rng)));
  if (coin(rng) < error_rate) throw std::runtime_error("simulated request failure");
}

void producer(MetricsEngine& engine, int id, double error_rate, const std::atomic<bool>& running,
              std::atomic<int>& in_flight) {
  std::mt19937 rng(static_cast<unsigned>(id) * 7919u + 17u);
  const Labels labels{{"worker", std::to_string(id % 2)}};
  const std::string map_id = "map_" + std::to_string(id);

  while (running) {
    engine.set_gauge("requests_in_flight", ++in_flight);
    auto t0 = Clock::now();
    bool ok = true;
    try {
      instrument(engine, "request", labels, [&] { simulated_request(rng, error_rate); });
    } catch (const std::runtime_error& e) {
      ok = false;
      spdlog::debug("producer {}: {}", id, e.what());
    }
    const double secs = duration<double>(Clock::now() - t0).count();
    engine.set_gauge("requests_in_flight", --in_flight);

    engine.record_outcome("localization", ok, secs);
    engine.record_sample_at("map_load_duration", secs, WallClock::now(), {}, {{"map_id", map_id}});
    engine.increment_counter("requests_total", 1, labels);
  }
}

void log_summary(MetricsEngine& engine) {
  const auto s = engine.summarize("localization_processing_time");
  const auto ok = engine.get_counter("localization_success_total").value_or(0);
  const auto failed = engine.get_counter("localization_failure_total").value_or(0);
  spdlog::info("=== PERFORMANCE SUMMARY ===");
  spdlog::info("Requests: {} ok, {} failed", ok, failed);
  if (s.avg) {
    spdlog::info("Processing time avg={:.3f}ms p50={:.3f}ms p95={:.3f}ms p99={:.3f}ms",
                 *s.avg * 1000.0, *s.p50 * 1000.0, *s.p95 * 1000.0, *s.p99 * 1000.0);
  }
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"StatKeeper-RT: in-process metrics aggregation engine (demo load generator)"};

  std::string cfg_path;
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  int producers = -1;
  cli_app.add_option("--producers", producers, "Number of producer threads")
      ->check(CLI::Range(1, 256));

  double duration_s = -1.0;
  cli_app.add_option("--duration", duration_s, "Run time in seconds")
      ->check(CLI::PositiveNumber);

  std::string format = "both";
  cli_app.add_option("--format", format, "Output format")
      ->check(CLI::IsMember({"json", "prometheus", "both"}));

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "StatKeeper-RT v1.0.0" << std::endl;
    std::cout << "Counters, gauges and windowed histograms with Prometheus text export"
              << std::endl;
    return 0;
  }

  // stdout carries the exported metrics, so logs go to stderr.
  spdlog::set_default_logger(spdlog::stderr_color_mt("statkeeper"));
  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app{};
  if (!cfg_path.empty()) {
    try {
      app = load_config(cfg_path);
    } catch (const YAML::Exception& e) {
      spdlog::error("Cannot read config '{}': {}", cfg_path, e.what());
      return 1;
    } catch (const std::invalid_argument& e) {
      spdlog::error("Invalid config '{}': {}", cfg_path, e.what());
      return 1;
    }
  }
  apply_log_level(app.log_level);
  if (producers > 0) app.demo.producers = producers;
  if (duration_s > 0) app.demo.duration_s = duration_s;

  spdlog::info("StatKeeper-RT starting (config: {}, producers: {}, duration: {}s)",
               cfg_path.empty() ? "<defaults>" : cfg_path, app.demo.producers,
               app.demo.duration_s);

  MetricsEngine engine(app.engine);
  engine.start_retention_loop();

  std::atomic<bool> running{true};
  std::atomic<int> in_flight{0};
  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(app.demo.producers));
  for (int i = 0; i < app.demo.producers; ++i) {
    threads.emplace_back(producer, std::ref(engine), i, app.demo.error_rate, std::cref(running),
                         std::ref(in_flight));
  }

  const auto deadline = Clock::now() + duration<double>(app.demo.duration_s);
  auto last_summary = Clock::now();
  while (Clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(50));
    if (Clock::now() - last_summary >= seconds(app.summary_interval_s)) {
      log_summary(engine);
      last_summary = Clock::now();
    }
  }

  running = false;
  for (auto& t : threads) t.join();
  engine.stop_retention_loop();
  log_summary(engine);

  if (format == "json" || format == "both") {
    std::cout << to_json(engine.get_snapshot()).dump(2) << std::endl;
  }
  if (format == "prometheus" || format == "both") {
    std::cout << engine.render_prometheus_text();
  }

  spdlog::info("Shutdown complete.");
  return 0;
}
