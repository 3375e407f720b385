#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace brownbot {

struct Rgb {
  std::uint8_t r = 0;
  std::uint8_t g = 0;
  std::uint8_t b = 0;

  friend bool operator==(const Rgb&, const Rgb&) = default;
};

// Animated GIF89a encoder for palette-indexed frames (simple manual emitter).
// Frames are width*height palette indices, row-major, top row first.
// The palette holds 2..256 colours and is padded to a power of two.
class GifWriter {
public:
  // Writes to a file; throws OutputError if it cannot be created.
  GifWriter(const std::string& path, int width, int height,
            std::vector<Rgb> palette, int delay_cs, bool loop = true);
  // Writes to a caller-owned stream (tests).
  GifWriter(std::ostream& out, int width, int height,
            std::vector<Rgb> palette, int delay_cs, bool loop = true);
  ~GifWriter();

  GifWriter(const GifWriter&) = delete;
  GifWriter& operator=(const GifWriter&) = delete;

  // Throws std::invalid_argument for a wrong pixel count or an index outside
  // the palette, OutputError when the stream fails.
  void add_frame(std::span<const std::uint8_t> indices);

  // Writes the trailer and flushes. Safe to call more than once.
  void finish();

  std::size_t frames() const { return frames_; }
  int width() const { return width_; }
  int height() const { return height_; }

  // Frame delay in hundredths of a second for a playback rate.
  static int delay_for_fps(int fps);

private:
  void write_header_(bool loop);
  void check_stream_(const char* what) const;

  std::unique_ptr<std::ofstream> file_;
  std::ostream* out_{nullptr};
  std::string where_;
  int width_{0};
  int height_{0};
  std::vector<Rgb> palette_;
  int size_bits_{1};   // palette holds 2^size_bits entries
  int delay_cs_{3};
  std::size_t frames_{0};
  bool finished_{false};
};

// LZW-compress palette indices the way GIF image data expects, returning the
// raw code stream (before sub-block framing).
std::vector<std::uint8_t> gif_lzw_encode(std::span<const std::uint8_t> indices, int min_code_size);

} // namespace brownbot
