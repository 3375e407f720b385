#include <brownbot/viewer/live_renderer.hpp>
#include <cstdio>
#include <filesystem>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include <brownbot/viewer/draw.hpp>

namespace brownbot {

LiveOptions LiveOptions::from_config(const SimConfig& cfg) {
  LiveOptions o;
  o.window_size = cfg.window_size;
  o.max_trail_points = static_cast<std::size_t>(cfg.max_trail_points);
  o.save_frames = cfg.save_output;
  o.frames_dir = (std::filesystem::path(cfg.output_path) / "frames").string();
  return o;
}

LiveRenderer::LiveRenderer(LiveOptions opts)
  : opts_(std::move(opts)), trail_(opts_.max_trail_points) {}

LiveRenderer::~LiveRenderer() = default;

std::string LiveRenderer::frame_path(const std::string& dir, std::size_t n) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame_%05zu.png", n);
  return (std::filesystem::path(dir) / name).string();
}

void LiveRenderer::attach(const ArenaSpec& arena, const RobotSpec& robot) {
  arena_ = arena;
  robot_ = robot;
  attached_ = true;
  trail_ = TrailBuffer(opts_.max_trail_points);
  frames_written_ = 0;
  save_error_.clear();

  saving_ = opts_.save_frames;
  if (saving_) {
    std::error_code ec;
    std::filesystem::create_directories(opts_.frames_dir, ec);
    if (ec) {
      save_error_ = "cannot create " + opts_.frames_dir + ": " + ec.message();
      spdlog::error("Frame export disabled: {}", save_error_);
      saving_ = false;
    }
  }
}

RenderReport LiveRenderer::render(Simulation& sim) {
  RenderReport report;
  attach(sim.arena(), sim.robot());

  // The driver paces ticks, so the window itself is left uncapped.
  window_ = std::make_unique<WindowGuard>(opts_.window_size, opts_.window_size,
                                          "Brownian Motion Robot Simulation", 0);
  if (!window_->ready()) {
    window_.reset();
    report.history = PositionHistory(sim.initial_state().position);
    report.export_error = "no display available for the live view";
    spdlog::error("Live view unavailable: no display");
    return report;
  }

  spdlog::info("Running real-time simulation for up to {:.1f} seconds...", sim.options().duration_s);
  report.history = sim.run_realtime(*this);
  window_.reset();

  report.frames_written = frames_written_;
  report.export_error = save_error_;
  if (frames_written_ > 0) {
    report.artifact_path = opts_.frames_dir;
    spdlog::info("Saved {} frames to {}/", frames_written_, opts_.frames_dir);
    spdlog::info("To create a video, you can use ffmpeg:");
    spdlog::info("ffmpeg -framerate 30 -i {}/frame_%05d.png -c:v libx264 -pix_fmt yuv420p output.mp4",
                 opts_.frames_dir);
  }
  return report;
}

void LiveRenderer::on_start(const RobotState& initial) {
  trail_.push(initial.position);
  if (saving_) save_frame_(initial);
  draw_(initial);
}

bool LiveRenderer::on_tick(const RobotState& state) {
  trail_.push(state.position);
  if (saving_) save_frame_(state);
  if (!window_) return true;
  draw_(state);
  return !WindowShouldClose();
}

void LiveRenderer::draw_(const RobotState& state) {
  if (!window_ || !attached_) return;
  BeginDrawing();
  draw_scene(arena_, robot_, trail_.points(), state.position, opts_.window_size);
  DrawText(TextFormat("t=%.1f  tick=%llu", state.sim_time, (unsigned long long)state.tick),
           10, 10, 18, DARKGRAY);
  EndDrawing();
}

// Frames come from the CPU rasterizer; the screen batch is not flushed until
// EndDrawing(), so reading the framebuffer mid-frame would miss the scene.
void LiveRenderer::save_frame_(const RobotState& state) {
  if (!attached_) return;
  const std::vector<Vec2> trail(trail_.points().begin(), trail_.points().end());
  FrameStyle style;
  style.size_px = opts_.window_size;
  ScopedImage frame = rasterize_frame(arena_, robot_, trail, state.position, style);

  const auto path = frame_path(opts_.frames_dir, frames_written_);
  if (!ExportImage(frame.get(), path.c_str())) {
    save_error_ = "failed to write " + path;
    spdlog::error("Frame export stopped: {}", save_error_);
    saving_ = false;
    return;
  }
  ++frames_written_;
}

} // namespace brownbot
