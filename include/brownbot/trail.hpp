#pragma once
#include <algorithm>
#include <cstddef>
#include <deque>
#include <span>
#include <brownbot/geom.hpp>
#include <brownbot/history.hpp>

namespace brownbot {

// Offline trail: the samples [frame - trail_length, frame] of a history,
// clamped to its bounds. Empty for an empty history.
inline std::span<const Vec2> trail_window(const PositionHistory& hist,
                                          std::size_t frame,
                                          std::size_t trail_length) {
  if (hist.empty()) return {};
  const std::size_t last = std::min(frame, hist.size() - 1);
  const std::size_t first = last > trail_length ? last - trail_length : 0;
  return std::span<const Vec2>(hist.points()).subspan(first, last - first + 1);
}

// Live trail: keeps the most recent `cap` samples.
class TrailBuffer {
public:
  explicit TrailBuffer(std::size_t cap = 500) : cap_(cap) {}

  void push(Vec2 p) {
    if (cap_ == 0) return;
    pts_.push_back(p);
    while (pts_.size() > cap_) pts_.pop_front();
  }
  void clear() { pts_.clear(); }

  std::size_t size() const { return pts_.size(); }
  std::size_t capacity() const { return cap_; }
  const std::deque<Vec2>& points() const { return pts_; }

private:
  std::size_t cap_;
  std::deque<Vec2> pts_;
};

} // namespace brownbot
