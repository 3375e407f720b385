#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <vector>

#include <brownbot/config.hpp>
#include <brownbot/sim_runner.hpp>

using Catch::Approx;
using namespace brownbot;

namespace {

struct Recorder : TickObserver {
  std::vector<RobotState> seen;
  bool started = false;
  std::size_t stop_after = 0; // 0 = never ask to stop

  void on_start(const RobotState& s) override {
    started = true;
    seen.push_back(s);
  }
  bool on_tick(const RobotState& s) override {
    seen.push_back(s);
    return stop_after == 0 || seen.size() - 1 < stop_after;
  }
};

struct Raiser : TickObserver {
  std::atomic<bool>* flag = nullptr;
  int ticks = 0;
  bool on_tick(const RobotState&) override {
    if (++ticks == 3) flag->store(true);
    return true;
  }
};

RobotState centre(double size) {
  RobotState s;
  s.position = {size / 2.0, size / 2.0};
  s.heading_rad = 0.4;
  return s;
}

} // namespace

TEST_CASE("observer can stop the run") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(5);
  Recorder rec;
  rec.stop_after = 7;

  RealtimeOptions opts;
  opts.target_hz = 0.0;
  opts.duration_s = 30.0;

  auto hist = run_realtime(arena, robot, centre(20.0), opts, rng, rec);
  REQUIRE(rec.started);
  REQUIRE(hist.size() == 8);           // initial + 7 ticks
  REQUIRE(rec.seen.size() == 8);       // on_start + 7 on_tick
  REQUIRE(rec.seen.back().tick == 7);
  REQUIRE(hist.back() == rec.seen.back().position);
}

TEST_CASE("max_ticks bounds the run") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(5);
  Recorder rec;

  RealtimeOptions opts;
  opts.target_hz = 0.0;
  opts.max_ticks = 25;

  auto hist = run_realtime(arena, robot, centre(20.0), opts, rng, rec);
  REQUIRE(hist.size() == 26);
  REQUIRE(rec.seen.back().sim_time == Approx(25 * opts.dt));
}

TEST_CASE("stop flag is honoured at the next tick boundary") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(9);
  std::atomic<bool> flag{false};
  Raiser obs;
  obs.flag = &flag;

  RealtimeOptions opts;
  opts.target_hz = 0.0;
  opts.duration_s = 30.0;

  auto hist = run_realtime(arena, robot, centre(20.0), opts, rng, obs, &flag);
  REQUIRE(obs.ticks == 3);
  REQUIRE(hist.size() == 4);
}

TEST_CASE("zero duration yields only the initial sample") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(1);
  Recorder rec;

  RealtimeOptions opts;
  opts.duration_s = 0.0;

  const auto init = centre(20.0);
  auto hist = run_realtime(arena, robot, init, opts, rng, rec);
  REQUIRE(hist.size() == 1);
  REQUIRE(hist[0] == init.position);
  REQUIRE(rec.started);
}

TEST_CASE("realtime rejects bad options") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(1);
  Recorder rec;

  RealtimeOptions opts;
  opts.dt = 0.0;
  REQUIRE_THROWS_AS(run_realtime(arena, robot, centre(20.0), opts, rng, rec), std::invalid_argument);

  opts.dt = 0.5;
  opts.duration_s = -1.0;
  REQUIRE_THROWS_AS(run_realtime(arena, robot, centre(20.0), opts, rng, rec), std::invalid_argument);
}

TEST_CASE("paced run respects the wall-clock budget") {
  ArenaSpec arena{10.0};
  RobotSpec robot{1.0, 3.0};
  std::mt19937 rng(77);
  Recorder rec;

  RealtimeOptions opts;
  opts.dt = 0.5;
  opts.duration_s = 0.2;
  opts.target_hz = 100.0;

  const auto t0 = std::chrono::steady_clock::now();
  auto hist = run_realtime(arena, robot, centre(10.0), opts, rng, rec);
  const double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  REQUIRE(wall >= 0.2);
  REQUIRE(wall < 2.0);
  REQUIRE(hist.size() > 1);
  REQUIRE(hist.size() <= 22); // at most ~20 ticks at 100 Hz
  for (const auto& p : hist) {
    REQUIRE(p.x >= robot.radius);
    REQUIRE(p.x <= arena.size - robot.radius);
    REQUIRE(p.y >= robot.radius);
    REQUIRE(p.y <= arena.size - robot.radius);
  }
  // Every tick advances by the fixed dt regardless of pacing jitter.
  for (std::size_t i = 1; i < rec.seen.size(); ++i)
    REQUIRE(rec.seen[i].sim_time == Approx(static_cast<double>(i) * opts.dt));
}

TEST_CASE("Simulation::run_realtime uses its own dt and records the final state") {
  std::mt19937 rng(4);
  ArenaSpec arena{40.0};
  RobotSpec robot{1.0, 1.0};
  SimOptions opts;
  opts.dt = 0.25;
  opts.target_hz = 0.0;
  opts.max_ticks = 12;
  Simulation sim(arena, robot, make_initial_state(arena, rng), std::mt19937(4), opts);
  REQUIRE(sim.options().realtime().dt == 0.25);

  Recorder rec;
  auto hist = sim.run_realtime(rec);
  REQUIRE(hist.size() == 13);
  REQUIRE(sim.final_state().tick == 12);
  REQUIRE(sim.final_state().sim_time == Approx(3.0));
  REQUIRE(sim.final_state().position == hist.back());
}

TEST_CASE("very long budgets do not cut the run short") {
  ArenaSpec arena{20.0};
  RobotSpec robot{1.0, 2.0};
  std::mt19937 rng(3);
  Recorder rec;

  RealtimeOptions opts;
  opts.duration_s = 1e10; // beyond steady_clock's nanosecond range
  opts.target_hz = 0.0;
  opts.max_ticks = 5;

  auto hist = run_realtime(arena, robot, centre(20.0), opts, rng, rec);
  REQUIRE(hist.size() == 6);
}

TEST_CASE("configured long duration runs until max_ticks") {
  auto cfg = config_from_yaml_string("duration: 1e10\ntarget_fps: 1000\nseed: 2\n");
  auto sim = Simulation::from_config(cfg);
  REQUIRE(sim.options().duration_s == Approx(1e10));

  RealtimeOptions opts = sim.options().realtime();
  opts.max_ticks = 5;
  opts.target_hz = 0.0;
  std::mt19937 rng(2);
  Recorder rec;
  auto hist = run_realtime(sim.arena(), sim.robot(), sim.initial_state(), opts, rng, rec);
  REQUIRE(hist.size() == 6);
}
