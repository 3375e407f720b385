#pragma once
#include <iterator>
#include <raylib.h>
#include <brownbot/viewer/raster.hpp>

namespace brownbot {

// RAII window: InitWindow on construction, CloseWindow on every exit path.
class WindowGuard {
public:
  WindowGuard(int w, int h, const char* title, int fps) {
    InitWindow(w, h, title);
    SetTargetFPS(fps);
  }
  ~WindowGuard() { if (IsWindowReady()) CloseWindow(); }
  WindowGuard(const WindowGuard&) = delete;
  WindowGuard& operator=(const WindowGuard&) = delete;

  bool ready() const { return IsWindowReady(); }
};

// Immediate-mode counterpart of rasterize_frame(); call between
// BeginDrawing()/EndDrawing(). Trail is any range of Vec2.
template <class TrailRange>
void draw_scene(const ArenaSpec& arena, const RobotSpec& robot,
                const TrailRange& trail, Vec2 robot_pos, int size_px) {
  ClearBackground(palette_color(kPalBackground));
  DrawRectangleLinesEx(Rectangle{0.0f, 0.0f, float(size_px), float(size_px)}, 2.0f,
                       palette_color(kPalBorder));

  auto it = std::begin(trail);
  const auto end = std::end(trail);
  if (it != end) {
    Vector2 prev = world_to_pixel(*it, arena, size_px);
    for (++it; it != end; ++it) {
      const Vector2 cur = world_to_pixel(*it, arena, size_px);
      DrawLineEx(prev, cur, 2.0f, palette_color(kPalTrail));
      prev = cur;
    }
  }

  const float scale = float(size_px / arena.size);
  DrawCircleV(world_to_pixel(robot_pos, arena, size_px),
              float(robot.radius) * scale, palette_color(kPalRobot));
}

} // namespace brownbot
