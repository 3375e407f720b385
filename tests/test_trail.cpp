#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <brownbot/trail.hpp>

using Catch::Approx;
using namespace brownbot;

static PositionHistory line_history(int n) {
  PositionHistory h(Vec2{0.0, 0.0});
  for (int i = 1; i < n; ++i) h.append(Vec2{double(i), 0.0});
  return h;
}

TEST_CASE("trail_window covers the last trail_length samples") {
  auto h = line_history(300);

  SECTION("early frames start at the beginning") {
    auto t = trail_window(h, 10, 100);
    REQUIRE(t.size() == 11);
    REQUIRE(t.front().x == Approx(0.0));
    REQUIRE(t.back().x == Approx(10.0));
  }
  SECTION("later frames are trimmed to the window") {
    auto t = trail_window(h, 250, 100);
    REQUIRE(t.size() == 101);
    REQUIRE(t.front().x == Approx(150.0));
    REQUIRE(t.back().x == Approx(250.0));
  }
  SECTION("frame beyond the end clamps to the last sample") {
    auto t = trail_window(h, 10'000, 5);
    REQUIRE(t.size() == 6);
    REQUIRE(t.back().x == Approx(299.0));
  }
  SECTION("zero length keeps only the current sample") {
    auto t = trail_window(h, 42, 0);
    REQUIRE(t.size() == 1);
    REQUIRE(t.front().x == Approx(42.0));
  }
}

TEST_CASE("trail_window on an empty history") {
  PositionHistory h;
  REQUIRE(trail_window(h, 0, 100).empty());
}

TEST_CASE("TrailBuffer keeps the most recent points") {
  TrailBuffer buf(3);
  for (int i = 0; i < 5; ++i) buf.push(Vec2{double(i), 1.0});
  REQUIRE(buf.size() == 3);
  REQUIRE(buf.capacity() == 3);
  REQUIRE(buf.points().front().x == Approx(2.0));
  REQUIRE(buf.points().back().x == Approx(4.0));

  buf.clear();
  REQUIRE(buf.size() == 0);
}

TEST_CASE("TrailBuffer with zero capacity stays empty") {
  TrailBuffer buf(0);
  buf.push(Vec2{1.0, 1.0});
  REQUIRE(buf.size() == 0);
}

TEST_CASE("PositionHistory basics") {
  PositionHistory h(Vec2{1.0, 2.0});
  REQUIRE(h.size() == 1);
  h.append(Vec2{3.0, 4.0});
  REQUIRE(h.back() == Vec2{3.0, 4.0});
  REQUIRE(h.front() == Vec2{1.0, 2.0});

  std::size_t n = 0;
  for (const auto& p : h) {
    (void)p;
    ++n;
  }
  REQUIRE(n == 2);
}
