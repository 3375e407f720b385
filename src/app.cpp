#include <brownbot/app.hpp>
#include <exception>
#include <filesystem>
#include <utility>
#include <spdlog/spdlog.h>
#include <brownbot/errors.hpp>
#include <brownbot/log.hpp>
#include <brownbot/sim_runner.hpp>
#include <brownbot/viewer/renderer.hpp>

namespace brownbot {

void App::log_summary_(const SimConfig& cfg, unsigned seed) const {
  spdlog::info("Running Brownian motion simulation:");
  spdlog::info("  Mode: {}", mode_name(cfg.mode));
  spdlog::info("  Arena size: {}", cfg.arena_size);
  spdlog::info("  Robot radius: {}", cfg.robot_radius);
  spdlog::info("  Speed: {}", cfg.speed);
  spdlog::info("  Time step: {}", cfg.time_step);
  spdlog::info("  Seed: {}{}", seed, cfg.seed ? "" : " (random)");
}

int App::run() {
  init_logging();

  SimConfig cfg;
  try {
    cfg = load_config(config_path_);
  } catch (const ConfigError& e) {
    spdlog::error("Invalid configuration: {}", e.what());
    return 1;
  }

  LogOptions log_opts;
  log_opts.level = parse_log_level(cfg.log_level);
  log_opts.file_path = cfg.log_file;
  try {
    init_logging(log_opts);
  } catch (const OutputError& e) {
    log_opts.file_path.clear();
    init_logging(log_opts);
    spdlog::error("{}; logging to console only", e.what());
  }

  try {
    if (cfg.save_output) {
      std::error_code ec;
      std::filesystem::create_directories(cfg.output_path, ec);
      if (ec) spdlog::error("Cannot create output directory '{}': {}", cfg.output_path, ec.message());
    }

    auto sim = Simulation::from_config(cfg);
    log_summary_(cfg, sim.seed());

    auto renderer = make_renderer(cfg);
    const auto report = renderer->render(sim);

    const auto& last = report.history.back();
    spdlog::info("{} renderer finished: {} samples, final position ({:.3f}, {:.3f})",
                 renderer->name(), report.history.size(), last.x, last.y);
    if (!report.export_error.empty())
      spdlog::warn("Output was not fully saved: {}", report.export_error);
  } catch (const std::exception& e) {
    spdlog::critical("Simulation aborted: {}", e.what());
    return 1;
  }
  return 0;
}

} // namespace brownbot
