#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <cysim/cadence.hpp>
#include <cysim/diagnostics.hpp>
#include <cysim/physics.hpp>
#include <cysim/power.hpp>
#include <cysim/validator.hpp>
#include <cysim/variance.hpp>

namespace cysim {

struct SimulationInput {
  int target_power = 0;               // W
  std::optional<int> manual_cadence;  // rpm; empty = automatic
  double grade_percent = 0.0;
  int randomness = 0;                 // 0..100
  bool is_resting = false;
};

struct SimulationState {
  int power_watts = 0;
  double speed_mps = 0.0;
  int cadence_rpm = 0;
  double fatigue = 0.0;
  double noise = 0.0;
  Gear gear{};
  double target_cadence = 0.0;
};

enum class ResetMode : int {
  TimeCursorOnly = 0,  // historic behaviour: rider state carries over
  Full,                // also clears fatigue, gear, smoothing and variance
};

struct EngineOptions {
  double dt_floor_s = 0.001;
  ResetMode reset_mode = ResetMode::TimeCursorOnly;
  std::uint32_t seed = 0;             // 0 = nondeterministic
  RiderCategory category = RiderCategory::Enthusiast;
  Gearset gearset{};
  RiderPrefs rider{};
  PowerOptions power{};
  double default_cadence_hint = 90.0; // rpm passed to the power model in auto mode
};

// "Now" in seconds on any monotonic scale.
using Clock = std::function<double()>;
Clock steady_clock_seconds();

// Owns one of each calculator and turns a target input into telemetry
// once per tick. Not safe for overlapping update() calls.
class SimulationEngine {
public:
  explicit SimulationEngine(PhysicsParams params = {},
                            EngineOptions opt = {},
                            std::shared_ptr<DiagnosticSink> sink = nullptr,
                            Clock clock = steady_clock_seconds());

  SimulationState update(const SimulationInput& in);

  void reset();                  // uses options().reset_mode
  void reset(ResetMode mode);

  const PhysicsParams& physics_params() const { return params_; }
  const EngineOptions& options() const { return opt_; }
  double last_dt() const { return last_dt_; }
  std::uint64_t tick_count() const { return ticks_; }
  double display_power() const { return power_.display_power(); }

private:
  void warn_if_invalid_(const ValidationResult& r, bool was_clamped, const char* what,
                        Context context);

  const PhysicsParams params_;
  const EngineOptions opt_;
  std::shared_ptr<DiagnosticSink> sink_;
  Clock clock_;

  VarianceProcess variance_;
  PowerManager power_;
  CadenceManager cadence_;

  double last_tick_s_ = 0.0;
  double last_dt_ = 0.0;
  std::uint64_t ticks_ = 0;
};

} // namespace cysim
