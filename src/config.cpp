#include <brownbot/config.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <brownbot/errors.hpp>
#include <brownbot/log.hpp>

namespace brownbot {

namespace {

constexpr std::array<std::string_view, 19> kKnownKeys = {
  "mode", "arena_size", "robot_radius", "speed", "time_step", "steps",
  "duration", "save_output", "output_path", "seed", "trail_length",
  "max_trail_points", "frame_interval_ms", "gif_fps", "target_fps",
  "window_size", "show_window", "log_level", "log_file",
};

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Reads root[key] into out when present and non-null.
template <class T>
void read_(const YAML::Node& root, const char* key, T& out) {
  const YAML::Node v = root[key];
  if (!v || v.IsNull()) return;
  try {
    out = v.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError("config", std::string("bad value for '") + key + "': " + e.what());
  }
}

void require_(bool ok, const std::string& what) {
  if (!ok) throw ConfigError("config", what);
}

} // namespace

const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Offline:  return "matplotlib";
    case Mode::Realtime: return "pygame";
  }
  return "unknown";
}

std::optional<Mode> parse_mode(const std::string& s) {
  const auto k = lower(s);
  if (k == "matplotlib" || k == "offline") return Mode::Offline;
  if (k == "pygame" || k == "realtime" || k == "live") return Mode::Realtime;
  return std::nullopt;
}

void validate(const SimConfig& cfg) {
  require_(std::isfinite(cfg.arena_size) && cfg.arena_size > 0.0, "arena_size must be positive");
  require_(std::isfinite(cfg.speed) && cfg.speed > 0.0, "speed must be positive");
  require_(std::isfinite(cfg.time_step) && cfg.time_step > 0.0, "time_step must be positive");
  require_(std::isfinite(cfg.robot_radius) && cfg.robot_radius >= 0.0, "robot_radius must be non-negative");
  require_(cfg.robot_radius < cfg.arena_size / 2.0, "robot_radius must be smaller than arena_size/2");
  require_(cfg.steps >= 0, "steps must be non-negative");
  require_(std::isfinite(cfg.duration) && cfg.duration > 0.0, "duration must be positive");
  require_(cfg.trail_length >= 0, "trail_length must be non-negative");
  require_(cfg.max_trail_points >= 0, "max_trail_points must be non-negative");
  require_(cfg.frame_interval_ms > 0, "frame_interval_ms must be positive");
  require_(cfg.gif_fps > 0, "gif_fps must be positive");
  require_(cfg.target_fps > 0, "target_fps must be positive");
  require_(cfg.window_size > 0, "window_size must be positive");
  require_(cfg.window_size <= kMaxWindowSize,
           "window_size must be at most " + std::to_string(kMaxWindowSize));
  require_(!cfg.output_path.empty() || !cfg.save_output, "output_path must be set when save_output is true");
  (void)parse_log_level(cfg.log_level); // throws ConfigError on unknown names
}

SimConfig config_from_yaml(std::istream& in) {
  YAML::Node root;
  try {
    root = YAML::Load(in);
  } catch (const YAML::Exception& e) {
    throw ConfigError("config", std::string("malformed document: ") + e.what());
  }

  SimConfig cfg;
  if (root.IsNull()) {
    validate(cfg);
    return cfg;
  }
  if (!root.IsMap()) throw ConfigError("config", "expected a mapping of key: value pairs");

  std::string mode = mode_name(cfg.mode);
  read_(root, "mode", mode);
  auto m = parse_mode(mode);
  if (!m) throw ConfigError("config", "unknown mode '" + mode + "'");
  cfg.mode = *m;

  read_(root, "arena_size", cfg.arena_size);
  read_(root, "robot_radius", cfg.robot_radius);
  read_(root, "speed", cfg.speed);
  read_(root, "time_step", cfg.time_step);
  read_(root, "steps", cfg.steps);
  read_(root, "duration", cfg.duration);
  read_(root, "save_output", cfg.save_output);
  read_(root, "output_path", cfg.output_path);

  const YAML::Node& doc = root;
  if (doc["seed"] && !doc["seed"].IsNull()) {
    std::uint32_t seed = 0;
    read_(doc, "seed", seed);
    cfg.seed = seed;
  }

  read_(root, "trail_length", cfg.trail_length);
  read_(root, "max_trail_points", cfg.max_trail_points);
  read_(root, "frame_interval_ms", cfg.frame_interval_ms);
  read_(root, "gif_fps", cfg.gif_fps);
  read_(root, "target_fps", cfg.target_fps);
  read_(root, "window_size", cfg.window_size);
  read_(root, "show_window", cfg.show_window);
  read_(root, "log_level", cfg.log_level);
  read_(root, "log_file", cfg.log_file);

  for (const auto& kv : root) {
    const auto key = kv.first.as<std::string>();
    if (std::find(kKnownKeys.begin(), kKnownKeys.end(), key) == kKnownKeys.end())
      spdlog::debug("config: ignoring unknown key '{}'", key);
  }

  validate(cfg);
  return cfg;
}

SimConfig config_from_yaml_string(const std::string& text) {
  std::istringstream ss(text);
  return config_from_yaml(ss);
}

std::string default_config_yaml() {
  return R"(# Brownian Motion Robot Simulation Configuration

# Visualization mode: 'matplotlib' (offline animation) or 'pygame' (real-time)
mode: matplotlib

# Arena size
arena_size: 100.0

# Robot radius
robot_radius: 2.0

# Movement speed
speed: 2.0

# Simulation time step
time_step: 0.5

# Number of simulation steps (for matplotlib mode)
steps: 1000

# Maximum simulation duration in seconds (for pygame mode)
duration: 60.0

# Whether to save visualization output
save_output: false

# Path to save output files
output_path: output

# Optional fixed random seed
# seed: 42
)";
}

SimConfig load_config(const std::string& path) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (fs::exists(path, ec)) {
    std::ifstream f(path);
    if (!f) throw ConfigError("config", "cannot read '" + path + "'");
    auto cfg = config_from_yaml(f);
    spdlog::info("Loaded config from '{}'", path);
    return cfg;
  }

  spdlog::warn("Config file '{}' not found. Using default settings.", path);
  ec.clear();
  const auto parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent, ec);
  std::ofstream out(path, std::ios::binary);
  if (!ec && out) {
    out << default_config_yaml();
  }
  if (ec || !out) {
    spdlog::error("Could not create default config file '{}'", path);
  } else {
    spdlog::info("Created default config file '{}'", path);
  }
  SimConfig cfg;
  validate(cfg);
  return cfg;
}

} // namespace brownbot
