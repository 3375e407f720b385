#include <brownbot/sim_runner.hpp>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <spdlog/spdlog.h>
#include <brownbot/config.hpp>

namespace brownbot {

namespace {

void require_dt_(double dt) {
  if (!std::isfinite(dt) || dt <= 0.0)
    throw std::invalid_argument("time step must be positive, got " + std::to_string(dt));
}

PositionHistory batch_(const ArenaSpec& arena, const RobotSpec& robot,
                       RobotState& state, std::int64_t steps, double dt,
                       std::mt19937& rng) {
  if (steps < 0)
    throw std::invalid_argument("step count must be non-negative, got " + std::to_string(steps));
  require_dt_(dt);

  PositionHistory hist(state.position);
  hist.reserve(static_cast<std::size_t>(steps) + 1);
  std::uint64_t hits = 0;
  for (std::int64_t i = 0; i < steps; ++i) {
    auto out = step_detailed(state, arena, robot, dt, rng);
    if (out.collided()) ++hits;
    state = out.state;
    hist.append(state.position);
  }
  spdlog::debug("batch run: {} steps, {} wall hits, sim_time={:.3f}", steps, hits, state.sim_time);
  return hist;
}

PositionHistory realtime_(const ArenaSpec& arena, const RobotSpec& robot,
                          RobotState& state, const RealtimeOptions& opts,
                          std::mt19937& rng, TickObserver& observer,
                          const std::atomic<bool>* stop) {
  require_dt_(opts.dt);
  if (!std::isfinite(opts.duration_s) || opts.duration_s < 0.0)
    throw std::invalid_argument("duration must be non-negative");

  using clock = std::chrono::steady_clock;
  const auto start = clock::now();
  // Kept in floating-point seconds; large budgets overflow clock::duration.
  const std::chrono::duration<double> budget(opts.duration_s);
  const bool paced = opts.target_hz > 0.0;
  const auto tick_ns = paced
      ? std::chrono::nanoseconds(static_cast<long long>(1e9 / opts.target_hz))
      : std::chrono::nanoseconds(0);
  auto next = start;

  PositionHistory hist(state.position);
  observer.on_start(state);

  while (true) {
    // Stop conditions are only evaluated between ticks.
    if (stop && stop->load(std::memory_order_acquire)) break;
    if (opts.max_ticks != 0 && hist.size() - 1 >= opts.max_ticks) break;
    if (clock::now() - start >= budget) break;

    state = step(state, arena, robot, opts.dt, rng);
    hist.append(state.position);
    if (!observer.on_tick(state)) break;

    if (paced) {
      next += tick_ns;
      std::this_thread::sleep_until(next);
    }
  }
  spdlog::debug("realtime run: {} ticks in {:.2f}s wall",
                hist.size() - 1,
                std::chrono::duration<double>(clock::now() - start).count());
  return hist;
}

} // namespace

PositionHistory run_simulation(const ArenaSpec& arena, const RobotSpec& robot,
                               const RobotState& initial, std::int64_t steps,
                               double dt, std::mt19937& rng) {
  RobotState state = initial;
  return batch_(arena, robot, state, steps, dt, rng);
}

PositionHistory run_realtime(const ArenaSpec& arena, const RobotSpec& robot,
                             const RobotState& initial, const RealtimeOptions& opts,
                             std::mt19937& rng, TickObserver& observer,
                             const std::atomic<bool>* stop) {
  RobotState state = initial;
  return realtime_(arena, robot, state, opts, rng, observer, stop);
}

PositionHistory RobotSim::run(std::int64_t steps, double dt, std::mt19937& rng) {
  return batch_(arena, robot, state, steps, dt, rng);
}

// ---- Simulation ----

Simulation::Simulation(ArenaSpec arena, RobotSpec robot, RobotState initial, std::mt19937 rng,
                       SimOptions opts)
  : arena_(arena), robot_(robot), initial_(initial), final_(initial), rng_(std::move(rng)),
    opts_(opts) {
  validate(initial_, arena_, robot_);
}

Simulation Simulation::from_config(const SimConfig& cfg) {
  const std::uint32_t seed = cfg.seed.has_value()
      ? *cfg.seed
      : static_cast<std::uint32_t>(std::random_device{}());
  std::mt19937 rng(seed);

  ArenaSpec arena{cfg.arena_size};
  RobotSpec robot{cfg.robot_radius, cfg.speed};
  RobotState initial = make_initial_state(arena, rng);

  SimOptions opts;
  opts.dt = cfg.time_step;
  opts.steps = cfg.steps;
  opts.duration_s = cfg.duration;
  opts.target_hz = static_cast<double>(cfg.target_fps);

  Simulation sim(arena, robot, initial, std::move(rng), opts);
  sim.seed_ = seed;
  return sim;
}

PositionHistory Simulation::run_batch() {
  RobotState state = initial_;
  auto hist = batch_(arena_, robot_, state, opts_.steps, opts_.dt, rng_);
  final_ = state;
  return hist;
}

PositionHistory Simulation::run_realtime(TickObserver& observer, const std::atomic<bool>* stop) {
  RobotState state = initial_;
  auto hist = realtime_(arena_, robot_, state, opts_.realtime(), rng_, observer, stop);
  final_ = state;
  return hist;
}

} // namespace brownbot
