#pragma once
#include <cstdint>
#include <random>
#include <brownbot/geom.hpp>
#include <brownbot/history.hpp>

namespace brownbot {

// Square arena spanning [0, size] x [0, size] (origin at the lower-left corner).
struct ArenaSpec {
  double size = 100.0;       // side length
};

struct RobotSpec {
  double radius = 2.0;       // disk radius
  double speed = 2.0;        // distance per unit sim-time
};

struct RobotState {
  Vec2 position{};
  double heading_rad = 0.0;  // direction of travel, CCW from +x
  double sim_time = 0.0;     // accumulated sim time
  std::uint64_t tick = 0;    // completed steps
};

// Wall contact bits reported by wall_contacts().
enum WallBits : unsigned {
  kWallNone   = 0u,
  kWallLeft   = 1u << 0,
  kWallRight  = 1u << 1,
  kWallBottom = 1u << 2,
  kWallTop    = 1u << 3,
};

struct StepOutcome {
  RobotState state;
  unsigned walls = kWallNone; // walls touched by the candidate position
  bool collided() const { return walls != kWallNone; }
};

// Throw std::invalid_argument when the geometry is unusable
// (size <= 0, radius < 0, speed <= 0, 2*radius >= size, non-finite values).
void validate(const ArenaSpec& arena, const RobotSpec& robot);
// Also requires the state to be finite and the disk fully inside the arena.
void validate(const RobotState& state, const ArenaSpec& arena, const RobotSpec& robot);

// Walls a disk centred at `p` touches or crosses (inclusive comparison).
unsigned wall_contacts(Vec2 p, const ArenaSpec& arena, const RobotSpec& robot);

// One step of the walk. On contact the offending coordinates are clamped back
// inside the arena and the heading becomes (heading + pi + U(-pi/2, pi/2)) mod 2pi,
// with a single draw from `rng` even for corner hits. dt must be positive.
StepOutcome step_detailed(const RobotState& state, const ArenaSpec& arena,
                          const RobotSpec& robot, double dt, std::mt19937& rng);

inline RobotState step(const RobotState& state, const ArenaSpec& arena,
                       const RobotSpec& robot, double dt, std::mt19937& rng) {
  return step_detailed(state, arena, robot, dt, rng).state;
}

// Arena centre with a uniformly random heading in [0, 2pi).
RobotState make_initial_state(const ArenaSpec& arena, std::mt19937& rng);

// Bundle of geometry and state for direct programmatic use.
struct RobotSim {
  ArenaSpec arena;
  RobotSpec robot;
  RobotState state;

  static RobotSim make(double arena_size, double robot_radius, double speed, std::mt19937& rng);

  // Advances `state` by one step; returns true when a wall was hit.
  bool step(double dt, std::mt19937& rng);

  // Runs from the current state; `state` is left at the last sample.
  PositionHistory run(std::int64_t steps, double dt, std::mt19937& rng);
};

} // namespace brownbot
