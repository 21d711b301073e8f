#pragma once
#include <cstdint>
#include <cysim/engine.hpp>

namespace cysim {

// Single immutable sample of rider state for the client
struct SimSnapshot {
  std::uint64_t tick = 0;       // runner tick index
  double sim_time = 0.0;        // accumulated sim time (s)
  SimulationState state{};
  double display_power = 0.0;   // rolling mean (W)
  // Echo of the inputs that produced it
  int target_power = 0;
  double grade_percent = 0.0;
  int randomness = 0;
  int manual_cadence = -1;      // -1 = auto
  bool resting = false;
};

} // namespace cysim
