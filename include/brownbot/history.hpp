#pragma once
#include <cstddef>
#include <vector>
#include <brownbot/geom.hpp>

namespace brownbot {

// Ordered, append-only record of sampled robot positions.
class PositionHistory {
public:
  PositionHistory() = default;
  explicit PositionHistory(Vec2 initial) { pts_.push_back(initial); }

  void reserve(std::size_t n) { pts_.reserve(n); }
  void append(Vec2 p) { pts_.push_back(p); }

  std::size_t size() const { return pts_.size(); }
  bool empty() const { return pts_.empty(); }
  const Vec2& operator[](std::size_t i) const { return pts_[i]; }
  const Vec2& front() const { return pts_.front(); }
  const Vec2& back() const { return pts_.back(); }

  const std::vector<Vec2>& points() const { return pts_; }
  auto begin() const { return pts_.begin(); }
  auto end() const { return pts_.end(); }

  friend bool operator==(const PositionHistory&, const PositionHistory&) = default;

private:
  std::vector<Vec2> pts_;
};

} // namespace brownbot
