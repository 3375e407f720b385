#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <brownbot/trail.hpp>
#include <brownbot/viewer/renderer.hpp>

namespace brownbot {

class WindowGuard;

struct LiveOptions {
  int         window_size = 800;
  std::size_t max_trail_points = 500;
  bool        save_frames = false;
  std::string frames_dir = "output/frames";

  static LiveOptions from_config(const SimConfig& cfg);
};

// Real-time view fed tick by tick by the driver. Escape or closing the window
// stops the run at the next tick boundary.
class LiveRenderer : public Renderer, public TickObserver {
public:
  explicit LiveRenderer(LiveOptions opts);
  ~LiveRenderer() override;

  const char* name() const override { return "live"; }
  RenderReport render(Simulation& sim) override;

  // Binds the run geometry and resets the trail and frame export. render()
  // calls it; without a window the renderer only exports frames.
  void attach(const ArenaSpec& arena, const RobotSpec& robot);

  void on_start(const RobotState& initial) override;
  bool on_tick(const RobotState& state) override;

  std::size_t frames_written() const { return frames_written_; }
  const std::string& save_error() const { return save_error_; }

  // Path of the n-th saved frame: <dir>/frame_00042.png
  static std::string frame_path(const std::string& dir, std::size_t n);

private:
  void draw_(const RobotState& state);
  void save_frame_(const RobotState& state);

  LiveOptions opts_;
  TrailBuffer trail_;
  ArenaSpec arena_{};
  RobotSpec robot_{};
  bool attached_{false};
  std::unique_ptr<WindowGuard> window_;
  bool saving_{false};
  std::size_t frames_written_{0};
  std::string save_error_;
};

} // namespace brownbot
