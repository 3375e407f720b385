#pragma once
#include <atomic>
#include <cstdint>
#include <random>
#include <brownbot/history.hpp>
#include <brownbot/sim.hpp>

namespace brownbot {

struct SimConfig;

// Batch driver: `steps` steps of size `dt` from `initial`.
// Returns steps + 1 positions. Throws std::invalid_argument for steps < 0 or dt <= 0.
PositionHistory run_simulation(const ArenaSpec& arena, const RobotSpec& robot,
                               const RobotState& initial, std::int64_t steps,
                               double dt, std::mt19937& rng);

// Receives the real-time driver's states at tick boundaries.
class TickObserver {
public:
  virtual ~TickObserver() = default;
  virtual void on_start(const RobotState& initial) { (void)initial; }
  // Return false to stop the run after this tick.
  virtual bool on_tick(const RobotState& state) = 0;
};

struct RealtimeOptions {
  double dt = 0.5;            // fixed sim step per tick
  double duration_s = 60.0;   // wall-clock budget
  double target_hz = 60.0;    // tick pacing; <= 0 runs unpaced
  std::uint64_t max_ticks = 0; // 0 = unlimited
};

// Real-time driver. Every tick advances by the fixed opts.dt; the loop sleeps
// between ticks to hold target_hz and checks its stop conditions (budget,
// max_ticks, *stop, observer) only at tick boundaries.
PositionHistory run_realtime(const ArenaSpec& arena, const RobotSpec& robot,
                             const RobotState& initial, const RealtimeOptions& opts,
                             std::mt19937& rng, TickObserver& observer,
                             const std::atomic<bool>* stop = nullptr);

// Iteration parameters of a Simulation. One dt drives both policies.
struct SimOptions {
  double dt = 0.5;
  std::int64_t steps = 1000;     // batch length
  double duration_s = 60.0;      // realtime wall-clock budget
  double target_hz = 60.0;
  std::uint64_t max_ticks = 0;   // 0 = unlimited

  RealtimeOptions realtime() const { return {dt, duration_s, target_hz, max_ticks}; }
};

// Owns one run's geometry, initial state, generator and iteration parameters.
class Simulation {
public:
  Simulation(ArenaSpec arena, RobotSpec robot, RobotState initial, std::mt19937 rng,
             SimOptions opts = {});

  // Seeds from cfg.seed when set, std::random_device otherwise; starts at the arena centre.
  static Simulation from_config(const SimConfig& cfg);

  const ArenaSpec& arena() const { return arena_; }
  const RobotSpec& robot() const { return robot_; }
  const RobotState& initial_state() const { return initial_; }
  const RobotState& final_state() const { return final_; }
  std::uint32_t seed() const { return seed_; }
  const SimOptions& options() const { return opts_; }

  PositionHistory run_batch();
  PositionHistory run_realtime(TickObserver& observer, const std::atomic<bool>* stop = nullptr);

private:
  ArenaSpec arena_;
  RobotSpec robot_;
  RobotState initial_;
  RobotState final_;
  std::mt19937 rng_;
  SimOptions opts_;
  std::uint32_t seed_{0};
};

} // namespace brownbot
