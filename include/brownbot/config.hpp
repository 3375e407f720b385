#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace brownbot {

enum class Mode {
  Offline,   // batch run, replayable animation ("matplotlib")
  Realtime,  // live window driven tick by tick ("pygame")
};

// Largest accepted window_size; frames are window_size pixels square.
inline constexpr int kMaxWindowSize = 8192;

struct SimConfig {
  Mode        mode = Mode::Offline;
  double      arena_size = 100.0;
  double      robot_radius = 2.0;
  double      speed = 2.0;
  double      time_step = 0.5;
  std::int64_t steps = 1000;        // offline mode
  double      duration = 60.0;      // realtime mode, wall seconds
  bool        save_output = false;
  std::string output_path = "output";

  std::optional<std::uint32_t> seed; // unset = nondeterministic

  // Rendering
  int  trail_length = 100;          // offline trail samples
  int  max_trail_points = 500;      // live trail samples
  int  frame_interval_ms = 50;      // offline playback
  int  gif_fps = 30;
  int  target_fps = 60;             // live tick rate
  int  window_size = 800;           // pixels
  bool show_window = true;          // offline playback window

  // Logging
  std::string log_level = "info";
  std::string log_file;             // empty = console only
};

// Canonical key for a mode ("matplotlib" / "pygame").
const char* mode_name(Mode m);
// Accepts matplotlib/offline and pygame/realtime/live (case-insensitive).
std::optional<Mode> parse_mode(const std::string& s);

// Throws ConfigError when a field is out of range.
void validate(const SimConfig& cfg);

// Stream-based loader (test-friendly; no filesystem required).
// Flat YAML `key: value` pairs; unknown keys are ignored, missing keys keep
// their defaults. Throws ConfigError on malformed documents, mistyped values
// or failed validation.
SimConfig config_from_yaml(std::istream& in);
SimConfig config_from_yaml_string(const std::string& text);

// Filesystem wrapper. A missing file yields the defaults and a freshly
// written default document at `path`.
SimConfig load_config(const std::string& path = "config.yaml");

// The commented default document written by load_config.
std::string default_config_yaml();

} // namespace brownbot
