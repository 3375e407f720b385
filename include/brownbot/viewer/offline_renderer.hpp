#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <brownbot/viewer/raster.hpp>
#include <brownbot/viewer/renderer.hpp>

namespace brownbot {

struct OfflineOptions {
  FrameStyle  style{};
  std::size_t trail_length = 100;
  int         gif_fps = 30;
  int         frame_interval_ms = 50;
  bool        save = false;
  std::string output_path = "output";
  bool        show_window = true;

  static OfflineOptions from_config(const SimConfig& cfg);
};

// Batch run -> frame-by-frame animation, optionally saved as
// <output_path>/brownian_simulation.gif and replayed in a window.
class OfflineRenderer : public Renderer {
public:
  explicit OfflineRenderer(OfflineOptions opts) : opts_(std::move(opts)) {}

  const char* name() const override { return "offline"; }
  RenderReport render(Simulation& sim) override;

  // Writes the animation of `hist`; returns the number of frames. Throws OutputError.
  std::size_t export_gif(const std::string& path, const ArenaSpec& arena,
                         const RobotSpec& robot, const PositionHistory& hist) const;

  static std::string gif_path(const std::string& output_path);

private:
  void play_(const ArenaSpec& arena, const RobotSpec& robot, const PositionHistory& hist) const;

  OfflineOptions opts_;
};

} // namespace brownbot
