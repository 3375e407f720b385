#include <brownbot/sim.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace brownbot {

static bool finite(double v) { return std::isfinite(v); }

void validate(const ArenaSpec& arena, const RobotSpec& robot) {
  if (!finite(arena.size) || arena.size <= 0.0)
    throw std::invalid_argument("arena size must be positive, got " + std::to_string(arena.size));
  if (!finite(robot.radius) || robot.radius < 0.0)
    throw std::invalid_argument("robot radius must be non-negative, got " + std::to_string(robot.radius));
  if (!finite(robot.speed) || robot.speed <= 0.0)
    throw std::invalid_argument("robot speed must be positive, got " + std::to_string(robot.speed));
  if (2.0 * robot.radius >= arena.size)
    throw std::invalid_argument("robot diameter must be smaller than the arena");
}

void validate(const RobotState& state, const ArenaSpec& arena, const RobotSpec& robot) {
  validate(arena, robot);
  if (!finite(state.position.x) || !finite(state.position.y) || !finite(state.heading_rad))
    throw std::invalid_argument("robot state must be finite");
  const double lo = robot.radius;
  const double hi = arena.size - robot.radius;
  if (state.position.x < lo || state.position.x > hi ||
      state.position.y < lo || state.position.y > hi)
    throw std::invalid_argument("robot must start fully inside the arena");
}

unsigned wall_contacts(Vec2 p, const ArenaSpec& arena, const RobotSpec& robot) {
  unsigned walls = kWallNone;
  if (p.x - robot.radius <= 0.0)         walls |= kWallLeft;
  else if (p.x + robot.radius >= arena.size) walls |= kWallRight;
  if (p.y - robot.radius <= 0.0)         walls |= kWallBottom;
  else if (p.y + robot.radius >= arena.size) walls |= kWallTop;
  return walls;
}

StepOutcome step_detailed(const RobotState& state, const ArenaSpec& arena,
                          const RobotSpec& robot, double dt, std::mt19937& rng) {
  if (!finite(dt) || dt <= 0.0)
    throw std::invalid_argument("step dt must be positive, got " + std::to_string(dt));

  StepOutcome out{state, kWallNone};
  RobotState& next = out.state;

  const Vec2 v = heading_vector(state.heading_rad) * robot.speed;
  Vec2 cand = state.position + v * dt;

  out.walls = wall_contacts(cand, arena, robot);
  if (out.walls != kWallNone) {
    // Axes are clamped independently so a corner hit keeps both coordinates inside.
    const double lo = robot.radius;
    const double hi = arena.size - robot.radius;
    if (out.walls & (kWallLeft | kWallRight))  cand.x = std::clamp(cand.x, lo, hi);
    if (out.walls & (kWallBottom | kWallTop))  cand.y = std::clamp(cand.y, lo, hi);

    std::uniform_real_distribution<double> U(-kPI / 2.0, kPI / 2.0);
    next.heading_rad = wrap_angle(state.heading_rad + kPI + U(rng));
  }

  next.position = cand;
  next.sim_time = state.sim_time + dt;
  next.tick = state.tick + 1;
  return out;
}

RobotState make_initial_state(const ArenaSpec& arena, std::mt19937& rng) {
  std::uniform_real_distribution<double> U(0.0, kTAU);
  RobotState s;
  s.position = {arena.size / 2.0, arena.size / 2.0};
  s.heading_rad = wrap_angle(U(rng));
  return s;
}

RobotSim RobotSim::make(double arena_size, double robot_radius, double speed, std::mt19937& rng) {
  RobotSim sim;
  sim.arena.size = arena_size;
  sim.robot.radius = robot_radius;
  sim.robot.speed = speed;
  validate(sim.arena, sim.robot);
  sim.state = make_initial_state(sim.arena, rng);
  return sim;
}

bool RobotSim::step(double dt, std::mt19937& rng) {
  auto out = step_detailed(state, arena, robot, dt, rng);
  state = out.state;
  return out.collided();
}

} // namespace brownbot
