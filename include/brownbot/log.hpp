#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace brownbot {

struct LogOptions {
  std::string name = "brownbot";
  spdlog::level::level_enum level = spdlog::level::info;
  bool console_enabled = true;
  std::string file_path;   // empty = no file sink
};

// trace/debug/info/warn/error/critical/off; throws ConfigError otherwise.
spdlog::level::level_enum parse_log_level(const std::string& name);

// Builds the logger from the requested sinks and installs it as the spdlog
// default, so library code can log through spdlog::info() and friends.
// Calling it again replaces the previous logger.
std::shared_ptr<spdlog::logger> init_logging(const LogOptions& opts = LogOptions{});

} // namespace brownbot
