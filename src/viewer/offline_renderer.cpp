#include <brownbot/viewer/offline_renderer.hpp>
#include <algorithm>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <brownbot/errors.hpp>
#include <brownbot/gif_writer.hpp>
#include <brownbot/trail.hpp>
#include <brownbot/viewer/draw.hpp>

namespace brownbot {

OfflineOptions OfflineOptions::from_config(const SimConfig& cfg) {
  OfflineOptions o;
  o.style.size_px = cfg.window_size;
  o.trail_length = static_cast<std::size_t>(cfg.trail_length);
  o.gif_fps = cfg.gif_fps;
  o.frame_interval_ms = cfg.frame_interval_ms;
  o.save = cfg.save_output;
  o.output_path = cfg.output_path;
  o.show_window = cfg.show_window;
  return o;
}

std::string OfflineRenderer::gif_path(const std::string& output_path) {
  return (std::filesystem::path(output_path) / "brownian_simulation.gif").string();
}

std::size_t OfflineRenderer::export_gif(const std::string& path, const ArenaSpec& arena,
                                        const RobotSpec& robot, const PositionHistory& hist) const {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) throw OutputError("gif " + path, "cannot create directory: " + ec.message());
  }

  const int n = opts_.style.size_px;
  if (n <= 0 || n > 0xFFFF)
    throw OutputError("gif " + path, "frame size " + std::to_string(n) + " px is out of range");
  GifWriter gif(path, n, n, frame_palette(), GifWriter::delay_for_fps(opts_.gif_fps));
  for (std::size_t f = 0; f < hist.size(); ++f) {
    auto frame = rasterize_frame(arena, robot, trail_window(hist, f, opts_.trail_length),
                                 hist[f], opts_.style);
    const auto indices = image_to_indexed(frame.get());
    gif.add_frame(indices);
  }
  gif.finish();
  return gif.frames();
}

RenderReport OfflineRenderer::render(Simulation& sim) {
  RenderReport report;
  spdlog::info("Running offline simulation for {} steps...", sim.options().steps);
  report.history = sim.run_batch();

  if (opts_.save) {
    const auto path = gif_path(opts_.output_path);
    try {
      report.frames_written = export_gif(path, sim.arena(), sim.robot(), report.history);
      report.artifact_path = path;
      spdlog::info("Animation saved to {} ({} frames)", path, report.frames_written);
    } catch (const OutputError& e) {
      report.export_error = e.what();
      spdlog::error("Saving animation failed: {}", e.what());
    }
  }

  if (opts_.show_window) play_(sim.arena(), sim.robot(), report.history);
  return report;
}

void OfflineRenderer::play_(const ArenaSpec& arena, const RobotSpec& robot,
                            const PositionHistory& hist) const {
  if (hist.empty()) return;
  const int n = opts_.style.size_px;
  const int fps = std::max(1, 1000 / opts_.frame_interval_ms);
  WindowGuard window(n, n, "Brownian Motion Robot Simulation", fps);
  if (!window.ready()) {
    spdlog::warn("No display available; skipping animation playback");
    return;
  }

  // Loops like a repeating animation until the window is closed.
  std::size_t frame = 0;
  while (!WindowShouldClose()) {
    BeginDrawing();
    draw_scene(arena, robot, trail_window(hist, frame, opts_.trail_length), hist[frame], n);
    DrawText(TextFormat("frame %zu / %zu", frame, hist.size() - 1), 10, 10, 18, DARKGRAY);
    EndDrawing();
    frame = (frame + 1) % hist.size();
  }
}

} // namespace brownbot
