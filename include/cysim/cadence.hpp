#pragma once
#include <cstdint>
#include <random>
#include <vector>

namespace cysim {

// Drivetrain as (front, rear) tooth counts.
struct Gear {
  int front = 50;
  int rear  = 16;
  bool operator==(const Gear&) const = default;
};

struct Gearset {
  std::vector<int> chainrings{50, 34};
  std::vector<int> cassette{11, 12, 13, 14, 16, 18, 20, 22, 25, 28, 32};
};

// Cadence model preferences; defaults follow published road-cycling data.
struct RiderPrefs {
  double low_cadence    = 75.0;   // rpm at low power
  double high_cadence   = 95.0;   // rpm at high power
  double p50            = 250.0;  // W at the logistic midpoint
  double k_p            = 75.0;   // logistic slope (W)
  double max_uphill_drop = 14.0;  // rpm
  double grade_scale    = 6.0;    // percent
  double max_down_bump  = 6.0;    // rpm
  double ftp            = 250.0;  // W
  double wheel_circumference_m = 2.112;
};

struct CadenceState {
  double cadence = 0.0;  // rpm
  double target  = 0.0;  // rpm
  Gear   gear{};
  double fatigue = 0.0;  // 0..1
  double noise   = 0.0;  // rpm jitter
};

// Tracks cadence, fatigue and gear selection. Gear changes are a small
// state machine: the cadence implied by the current gear at the current
// speed must leave a hysteresis band around the target before the
// drivetrain steps one cog toward the best match.
class CadenceManager {
public:
  static constexpr double kShiftBand     = 8.0;  // rpm either side of target
  static constexpr double kRearCooldown  = 2.0;  // s
  static constexpr double kFrontCooldown = 4.0;  // s
  static constexpr double kFrontShiftDip = 8.0;  // rpm

  explicit CadenceManager(Gearset gears = {}, RiderPrefs prefs = {},
                          std::uint32_t seed = std::random_device{}());

  // Advances one step and returns the automatic cadence (rpm).
  double update(double power_w, double grade_percent, double speed_mps, double dt_s);

  CadenceState state() const;
  const Gearset& gearset() const { return gears_; }
  const RiderPrefs& prefs() const { return prefs_; }

  // Desired cadence for the given effort and terrain; bounded [40, 120].
  double target_cadence(double power_w, double grade_percent) const;
  // Best (front, rear) for a target cadence; {0, 0} below 0.5 m/s.
  Gear best_gear_for(double target_rpm, double speed_mps) const;

  void reset();

private:
  double gear_cadence_(double speed_mps, Gear g) const;
  void check_gear_shift_(double target_rpm, double speed_mps);
  void update_noise_(double dt);
  void update_fatigue_(double power_w, double dt);

  Gearset gears_;
  RiderPrefs prefs_;
  std::mt19937 rng_;
  std::normal_distribution<double> normal_{0.0, 1.0};

  Gear   initial_gear_{};
  Gear   gear_{};
  double base_ = 85.0;     // smoothed towards the gear cadence
  double cadence_ = 85.0;  // base_ plus jitter
  double target_ = 85.0;
  double fatigue_ = 0.0;
  double noise_ = 0.0;
  double clock_s_ = 0.0;
  double last_rear_shift_s_ = -1e9;
  double last_front_shift_s_ = -1e9;
};

} // namespace cysim
