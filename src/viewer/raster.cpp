#include <brownbot/viewer/raster.hpp>
#include <algorithm>
#include <cmath>

namespace brownbot {

const std::vector<Rgb>& frame_palette() {
  static const std::vector<Rgb> pal = {
    {255, 255, 255},  // background
    {0, 0, 0},        // border
    {220, 40, 40},    // trail
    {30, 80, 230},    // robot
  };
  return pal;
}

Color palette_color(PaletteIndex i) {
  const auto& c = frame_palette()[i];
  return Color{c.r, c.g, c.b, 255};
}

ScopedImage& ScopedImage::operator=(ScopedImage&& o) noexcept {
  if (this != &o) {
    if (img_.data) UnloadImage(img_);
    img_ = o.img_;
    o.img_ = Image{};
  }
  return *this;
}

Vector2 world_to_pixel(Vec2 p, const ArenaSpec& arena, int size_px) {
  const double scale = size_px / arena.size;
  return { float(p.x * scale), float(size_px - p.y * scale) };
}

ScopedImage rasterize_frame(const ArenaSpec& arena, const RobotSpec& robot,
                            std::span<const Vec2> trail, Vec2 robot_pos,
                            const FrameStyle& style) {
  const int n = style.size_px;
  ScopedImage frame(GenImageColor(n, n, palette_color(kPalBackground)));
  Image* img = &frame.get();

  for (std::size_t i = 1; i < trail.size(); ++i) {
    ImageDrawLineV(img, world_to_pixel(trail[i-1], arena, n),
                        world_to_pixel(trail[i], arena, n),
                   palette_color(kPalTrail));
  }

  const double scale = n / arena.size;
  const int radius_px = std::max(1, int(std::lround(robot.radius * scale)));
  ImageDrawCircleV(img, world_to_pixel(robot_pos, arena, n), radius_px, palette_color(kPalRobot));

  // Border last so it stays crisp over the disk at the walls.
  ImageDrawRectangleLines(img, Rectangle{0.0f, 0.0f, float(n), float(n)},
                          style.border_px, palette_color(kPalBorder));
  return frame;
}

std::vector<std::uint8_t> image_to_indexed(const Image& img) {
  const std::size_t count = std::size_t(img.width) * std::size_t(img.height);
  std::vector<std::uint8_t> out(count, kPalBackground);
  Color* px = LoadImageColors(img);
  if (!px) return out;

  const auto& pal = frame_palette();
  for (std::size_t i = 0; i < count; ++i) {
    const Color c = px[i];
    int best = 0;
    int best_d = 1 << 30;
    for (std::size_t k = 0; k < pal.size(); ++k) {
      const int dr = int(c.r) - pal[k].r;
      const int dg = int(c.g) - pal[k].g;
      const int db = int(c.b) - pal[k].b;
      const int d = dr*dr + dg*dg + db*db;
      if (d < best_d) { best_d = d; best = int(k); }
    }
    out[i] = static_cast<std::uint8_t>(best);
  }
  UnloadImageColors(px);
  return out;
}

} // namespace brownbot
