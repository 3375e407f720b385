#include <brownbot/gif_writer.hpp>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <brownbot/errors.hpp>

namespace brownbot {

namespace {

constexpr int kMaxCode = 4095;

void put_u16(std::ostream& out, int v) {
  out.put(static_cast<char>(v & 0xFF));
  out.put(static_cast<char>((v >> 8) & 0xFF));
}

// LSB-first bit packer.
class BitSink {
public:
  explicit BitSink(std::vector<std::uint8_t>& out) : out_(out) {}
  void write(int code, int bits) {
    acc_ |= static_cast<std::uint32_t>(code) << nbits_;
    nbits_ += bits;
    while (nbits_ >= 8) {
      out_.push_back(static_cast<std::uint8_t>(acc_ & 0xFF));
      acc_ >>= 8;
      nbits_ -= 8;
    }
  }
  void flush() {
    if (nbits_ > 0) out_.push_back(static_cast<std::uint8_t>(acc_ & 0xFF));
    acc_ = 0;
    nbits_ = 0;
  }
private:
  std::vector<std::uint8_t>& out_;
  std::uint32_t acc_{0};
  int nbits_{0};
};

} // namespace

std::vector<std::uint8_t> gif_lzw_encode(std::span<const std::uint8_t> indices, int min_code_size) {
  if (min_code_size < 2 || min_code_size > 8)
    throw std::invalid_argument("gif: LZW minimum code size must be in [2, 8]");

  std::vector<std::uint8_t> bytes;
  BitSink sink(bytes);

  const int clear = 1 << min_code_size;
  const int eoi = clear + 1;
  int size = min_code_size + 1;
  int next = clear + 2;
  std::unordered_map<std::uint32_t, int> dict;

  // Every emitted code widens the code size once the table reaches 2^size,
  // matching the decoder, which runs one entry behind.
  auto emit = [&](int code) {
    sink.write(code, size);
    if (next >= (1 << size) && size < 12) ++size;
  };
  auto reset = [&]() {
    dict.clear();
    size = min_code_size + 1;
    next = clear + 2;
  };

  sink.write(clear, size);
  if (indices.empty()) {
    sink.write(eoi, size);
    sink.flush();
    return bytes;
  }

  int prefix = indices[0];
  for (std::size_t i = 1; i < indices.size(); ++i) {
    const int k = indices[i];
    const std::uint32_t key = (static_cast<std::uint32_t>(prefix) << 8) | static_cast<std::uint32_t>(k);
    auto it = dict.find(key);
    if (it != dict.end()) {
      prefix = it->second;
      continue;
    }
    emit(prefix);
    if (next < kMaxCode) {
      dict.emplace(key, next++);
    } else {
      sink.write(clear, size);
      reset();
    }
    prefix = k;
  }
  emit(prefix);
  sink.write(eoi, size);
  sink.flush();
  return bytes;
}

// ---- GifWriter ----

GifWriter::GifWriter(const std::string& path, int width, int height,
                     std::vector<Rgb> palette, int delay_cs, bool loop)
  : file_(std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::trunc)),
    where_("gif " + path), width_(width), height_(height),
    palette_(std::move(palette)), delay_cs_(delay_cs) {
  if (!*file_) throw OutputError(where_, "cannot open file for writing");
  out_ = file_.get();
  write_header_(loop);
}

GifWriter::GifWriter(std::ostream& out, int width, int height,
                     std::vector<Rgb> palette, int delay_cs, bool loop)
  : out_(&out), where_("gif"), width_(width), height_(height),
    palette_(std::move(palette)), delay_cs_(delay_cs) {
  write_header_(loop);
}

GifWriter::~GifWriter() {
  // Leave a well-formed file behind on early exits; errors surface through finish().
  if (!finished_ && out_) {
    out_->put(0x3B);
    out_->flush();
  }
}

int GifWriter::delay_for_fps(int fps) {
  if (fps <= 0) return 0;
  return std::max(1, static_cast<int>(100.0 / fps + 0.5));
}

void GifWriter::check_stream_(const char* what) const {
  if (!*out_) throw OutputError(where_, std::string("write failed: ") + what);
}

void GifWriter::write_header_(bool loop) {
  if (width_ <= 0 || height_ <= 0 || width_ > 0xFFFF || height_ > 0xFFFF)
    throw std::invalid_argument("gif: frame size out of range");
  if (palette_.size() < 2 || palette_.size() > 256)
    throw std::invalid_argument("gif: palette must hold 2..256 colours");
  if (delay_cs_ < 0 || delay_cs_ > 0xFFFF)
    throw std::invalid_argument("gif: frame delay out of range");

  size_bits_ = 1;
  while ((std::size_t(1) << size_bits_) < palette_.size()) ++size_bits_;
  palette_.resize(std::size_t(1) << size_bits_, Rgb{});

  out_->write("GIF89a", 6);
  put_u16(*out_, width_);
  put_u16(*out_, height_);
  // global table present, 8-bit colour resolution, table size 2^size_bits
  out_->put(static_cast<char>(0x80 | 0x70 | (size_bits_ - 1)));
  out_->put(0);   // background index
  out_->put(0);   // pixel aspect
  for (const auto& c : palette_) {
    out_->put(static_cast<char>(c.r));
    out_->put(static_cast<char>(c.g));
    out_->put(static_cast<char>(c.b));
  }

  if (loop) {
    // NETSCAPE2.0 application extension, loop forever
    out_->put(0x21); out_->put(static_cast<char>(0xFF)); out_->put(0x0B);
    out_->write("NETSCAPE2.0", 11);
    out_->put(0x03); out_->put(0x01);
    put_u16(*out_, 0);
    out_->put(0x00);
  }
  check_stream_("header");
}

void GifWriter::add_frame(std::span<const std::uint8_t> indices) {
  if (finished_) throw std::logic_error("gif: add_frame after finish");
  if (indices.size() != static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_))
    throw std::invalid_argument("gif: frame has wrong pixel count");
  const auto max_index = *std::max_element(indices.begin(), indices.end());
  if (max_index >= palette_.size())
    throw std::invalid_argument("gif: pixel index outside palette");

  // Graphic control extension: delay, no transparency
  out_->put(0x21); out_->put(static_cast<char>(0xF9)); out_->put(0x04);
  out_->put(0x04);   // disposal: leave in place
  put_u16(*out_, delay_cs_);
  out_->put(0x00);
  out_->put(0x00);

  // Image descriptor, full canvas, no local table
  out_->put(0x2C);
  put_u16(*out_, 0);
  put_u16(*out_, 0);
  put_u16(*out_, width_);
  put_u16(*out_, height_);
  out_->put(0x00);

  const int min_code_size = std::max(2, size_bits_);
  out_->put(static_cast<char>(min_code_size));
  const auto data = gif_lzw_encode(indices, min_code_size);
  for (std::size_t off = 0; off < data.size(); off += 255) {
    const std::size_t n = std::min<std::size_t>(255, data.size() - off);
    out_->put(static_cast<char>(n));
    out_->write(reinterpret_cast<const char*>(data.data() + off), static_cast<std::streamsize>(n));
  }
  out_->put(0x00);
  check_stream_("frame");
  ++frames_;
}

void GifWriter::finish() {
  if (finished_) return;
  finished_ = true;
  out_->put(0x3B);
  out_->flush();
  check_stream_("trailer");
  if (file_) {
    file_->close();
    if (file_->fail()) throw OutputError(where_, "close failed");
  }
}

} // namespace brownbot
