#include <brownbot/log.hpp>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <brownbot/errors.hpp>

namespace brownbot {

spdlog::level::level_enum parse_log_level(const std::string& name) {
  if (name == "trace")    return spdlog::level::trace;
  if (name == "debug")    return spdlog::level::debug;
  if (name == "info")     return spdlog::level::info;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error")    return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off")      return spdlog::level::off;
  throw ConfigError("log", "unknown log level '" + name + "'");
}

std::shared_ptr<spdlog::logger> init_logging(const LogOptions& opts) {
  std::vector<spdlog::sink_ptr> sinks;
  if (opts.console_enabled) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  if (!opts.file_path.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.file_path, /*truncate*/ false));
    } catch (const spdlog::spdlog_ex& e) {
      throw OutputError("log", "cannot open log file '" + opts.file_path + "': " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>(opts.name, sinks.begin(), sinks.end());
  logger->set_level(opts.level);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");

  spdlog::drop(opts.name);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
  return logger;
}

} // namespace brownbot
