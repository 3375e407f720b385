#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include <raylib.h>
#include <brownbot/geom.hpp>
#include <brownbot/gif_writer.hpp>
#include <brownbot/sim.hpp>

namespace brownbot {

// Palette slots shared by the rasterizer and the GIF export.
enum PaletteIndex : std::uint8_t {
  kPalBackground = 0,
  kPalBorder     = 1,
  kPalTrail      = 2,
  kPalRobot      = 3,
};

// White arena, black border, red trail, blue robot.
const std::vector<Rgb>& frame_palette();
Color palette_color(PaletteIndex i);

struct FrameStyle {
  int size_px = 800;       // square frame edge
  int border_px = 2;
};

// Owns a CPU-side raylib Image.
class ScopedImage {
public:
  explicit ScopedImage(Image img) : img_(img) {}
  ~ScopedImage() { if (img_.data) UnloadImage(img_); }
  ScopedImage(const ScopedImage&) = delete;
  ScopedImage& operator=(const ScopedImage&) = delete;
  ScopedImage(ScopedImage&& o) noexcept : img_(o.img_) { o.img_ = Image{}; }
  ScopedImage& operator=(ScopedImage&& o) noexcept;

  Image& get() { return img_; }
  const Image& get() const { return img_; }

private:
  Image img_{};
};

// Arena coordinates (y up) to frame pixels (y down).
Vector2 world_to_pixel(Vec2 p, const ArenaSpec& arena, int size_px);

// Draws the arena border, the trail polyline and the robot disk into a new
// image. Uses raylib's CPU image API; no window is needed.
ScopedImage rasterize_frame(const ArenaSpec& arena, const RobotSpec& robot,
                            std::span<const Vec2> trail, Vec2 robot_pos,
                            const FrameStyle& style);

// Maps each pixel to the nearest frame_palette() entry.
std::vector<std::uint8_t> image_to_indexed(const Image& img);

} // namespace brownbot
