#include <cysim/physics.hpp>
#include <algorithm>

namespace cysim {

namespace {

struct Forces {
  double constant_n; // gravity + rolling, independent of speed
  double k_aero;     // 0.5 * rho * CdA
  double wind;
};

Forces forces_for(double grade_percent, const PhysicsParams& p) {
  const double g = std::clamp(grade_percent, -30.0, 30.0);
  const double theta = std::atan(g / 100.0);
  const double m = std::max(0.0, p.mass_kg);
  const double gravity = m * kGravity * std::sin(theta);
  const double rolling = m * kGravity * std::max(0.0, p.crr) * std::cos(theta);
  return Forces{gravity + rolling, 0.5 * std::max(0.0, p.air_density) * std::max(0.0, p.cda), p.wind_mps};
}

// Power needed at the wheel to hold speed v.
double wheel_power(double v, const Forces& f) {
  const double rel = v + f.wind;
  return v * (f.constant_n + f.k_aero * rel * std::fabs(rel));
}

double wheel_power_dv(double v, const Forces& f) {
  const double rel = v + f.wind;
  return f.constant_n + f.k_aero * rel * std::fabs(rel) + 2.0 * f.k_aero * v * std::fabs(rel);
}

} // namespace

double speed_from_power(double power_w, double grade_percent, const PhysicsParams& p) {
  const Forces f = forces_for(grade_percent, p);
  const double eff = std::max(0.0, power_w) * std::clamp(p.efficiency, 0.0, 1.0);
  const double vmax = std::max(0.0, p.max_speed_mps);
  if (vmax == 0.0) return 0.0;

  // wheel_power is increasing past its minimum, so the root of
  // wheel_power(v) = eff is unique on [lo, hi] once bracketed.
  double lo = 0.0;
  double hi = vmax;
  if (wheel_power(hi, f) <= eff) return vmax;
  if (wheel_power(lo, f) >= eff && f.constant_n >= 0.0) return 0.0;

  // On descents the curve dips below zero; move lo past the dip.
  while (wheel_power(lo, f) > eff || wheel_power_dv(lo, f) < 0.0) {
    const double step = (hi - lo) / 64.0;
    if (step <= 1e-9) break;
    if (wheel_power(lo + step, f) > eff) { hi = lo + step; break; }
    lo += step;
  }

  double v = 0.5 * (lo + hi);
  for (int i = 0; i < 60; ++i) {
    const double err = wheel_power(v, f) - eff;
    if (err > 0.0) hi = v; else lo = v;
    if (std::fabs(err) < 1e-9 || hi - lo < 1e-10) break;

    const double d = wheel_power_dv(v, f);
    double next = (d > 1e-9) ? v - err / d : 0.5 * (lo + hi);
    if (!(next > lo && next < hi)) next = 0.5 * (lo + hi); // left the bracket: bisect
    v = next;
  }

  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, vmax);
}

double power_for_speed(double speed_mps, double grade_percent, const PhysicsParams& p) {
  const double v = std::max(0.0, speed_mps);
  const Forces f = forces_for(grade_percent, p);
  const double eff = std::clamp(p.efficiency, 0.0, 1.0);
  if (eff <= 0.0) return 0.0;
  return std::max(0.0, wheel_power(v, f) / eff);
}

} // namespace cysim
