#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <filesystem>
#include <random>
#include <string>

#include <brownbot/sim_runner.hpp>
#include <brownbot/viewer/live_renderer.hpp>
#include <brownbot/viewer/raster.hpp>

using namespace brownbot;
namespace fs = std::filesystem;

namespace {

struct TempDir {
  fs::path path;
  TempDir() {
    std::random_device rd;
    path = fs::temp_directory_path() / ("brownbot_live_" + std::to_string(rd()));
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

} // namespace

TEST_CASE("live renderer exports one drawn PNG per sample") {
  TempDir tmp;
  LiveOptions opts;
  opts.window_size = 64;
  opts.save_frames = true;
  opts.frames_dir = (tmp.path / "frames").string();

  ArenaSpec arena{20.0};
  RobotSpec robot{2.0, 2.0};
  RobotState init;
  init.position = {10.0, 10.0};
  init.heading_rad = 0.3;

  LiveRenderer live(opts);
  live.attach(arena, robot);

  RealtimeOptions run;
  run.target_hz = 0.0;
  run.max_ticks = 5;
  std::mt19937 rng(12);
  auto hist = run_realtime(arena, robot, init, run, rng, live);

  REQUIRE(hist.size() == 6);
  REQUIRE(live.frames_written() == 6); // initial frame + one per tick
  REQUIRE(live.save_error().empty());

  for (std::size_t n = 0; n < 6; ++n) {
    const auto path = LiveRenderer::frame_path(opts.frames_dir, n);
    REQUIRE(fs::exists(path));

    ScopedImage img(LoadImage(path.c_str()));
    REQUIRE(img.get().width == 64);
    REQUIRE(img.get().height == 64);

    const auto idx = image_to_indexed(img.get());
    REQUIRE(std::count(idx.begin(), idx.end(), kPalBackground) > 0);
    REQUIRE(std::count(idx.begin(), idx.end(), kPalBorder) > 0);
    REQUIRE(std::count(idx.begin(), idx.end(), kPalRobot) > 0);
  }
  REQUIRE_FALSE(fs::exists(LiveRenderer::frame_path(opts.frames_dir, 6)));
}

TEST_CASE("live renderer without frame saving writes nothing") {
  TempDir tmp;
  LiveOptions opts;
  opts.window_size = 32;
  opts.frames_dir = (tmp.path / "frames").string();

  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  RobotState init;
  init.position = {10.0, 10.0};

  LiveRenderer live(opts);
  live.attach(arena, robot);

  RealtimeOptions run;
  run.target_hz = 0.0;
  run.max_ticks = 3;
  std::mt19937 rng(1);
  auto hist = run_realtime(arena, robot, init, run, rng, live);

  REQUIRE(hist.size() == 4);
  REQUIRE(live.frames_written() == 0);
  REQUIRE_FALSE(fs::exists(opts.frames_dir));
}
