#pragma once
#include <cmath>

namespace cysim {

inline constexpr double kGravity = 9.81;     // m/s^2
inline constexpr double kMsToKmh = 3.6;

// Rider + bike + environment. Immutable once handed to an engine.
struct PhysicsParams {
  double mass_kg       = 75.0;   // rider + bike
  double crr           = 0.004;  // rolling resistance coefficient
  double cda           = 0.32;   // drag coefficient x frontal area (m^2)
  double air_density   = 1.225;  // kg/m^3
  double efficiency    = 0.97;   // drivetrain
  double wind_mps      = 0.0;    // positive = headwind
  double max_speed_mps = 35.0;   // ~126 km/h cap
};

// Steady-state speed (m/s) at which propulsive power balances gravity,
// rolling and aerodynamic resistance. Monotone non-decreasing in power.
// Grade is clamped to [-30, 30] percent.
double speed_from_power(double power_w, double grade_percent, const PhysicsParams& p);

// Power (W at the pedals) needed to hold `speed_mps`. Never negative.
double power_for_speed(double speed_mps, double grade_percent, const PhysicsParams& p);

// Crank RPM mechanically implied by wheel speed and gear:
// 60 * v / C * (rear / front). Returns 0 for degenerate input.
inline double mechanical_cadence(double speed_mps, double wheel_circumference_m,
                                 int front, int rear) {
  if (speed_mps <= 0.0 || wheel_circumference_m <= 0.0 || front <= 0 || rear <= 0) return 0.0;
  return (60.0 * speed_mps / wheel_circumference_m) * (double(rear) / double(front));
}

} // namespace cysim
