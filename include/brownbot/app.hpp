#pragma once
#include <string>
#include <utility>
#include <brownbot/config.hpp>

namespace brownbot {

// Loads the config, sets up logging, runs one simulation and renders it.
class App {
public:
  explicit App(std::string config_path) : config_path_(std::move(config_path)) {}
  int run(); // 0 on success, 1 on configuration or unexpected errors

private:
  void log_summary_(const SimConfig& cfg, unsigned seed) const;

  std::string config_path_;
};

} // namespace brownbot
