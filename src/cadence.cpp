#include <cysim/cadence.hpp>
#include <cysim/physics.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <utility>

namespace cysim {

namespace {

bool valid_teeth(const std::vector<int>& v) {
  return !v.empty() && std::all_of(v.begin(), v.end(), [](int t){ return t > 0; });
}

int index_of(const std::vector<int>& v, int value) {
  auto it = std::find(v.begin(), v.end(), value);
  return it == v.end() ? 0 : static_cast<int>(it - v.begin());
}

} // namespace

CadenceManager::CadenceManager(Gearset gears, RiderPrefs prefs, std::uint32_t seed)
  : gears_(std::move(gears)), prefs_(prefs), rng_(seed) {
  if (!valid_teeth(gears_.chainrings) || !valid_teeth(gears_.cassette)) gears_ = Gearset{};
  if (prefs_.wheel_circumference_m <= 0.0) prefs_.wheel_circumference_m = RiderPrefs{}.wheel_circumference_m;
  if (prefs_.k_p <= 0.0) prefs_.k_p = RiderPrefs{}.k_p;
  if (prefs_.grade_scale <= 0.0) prefs_.grade_scale = RiderPrefs{}.grade_scale;

  const std::size_t mid = std::min<std::size_t>(4, gears_.cassette.size() - 1);
  initial_gear_ = Gear{gears_.chainrings.front(), gears_.cassette[mid]};
  gear_ = initial_gear_;
}

double CadenceManager::update(double power_w, double grade_percent, double speed_mps, double dt_s) {
  const double dt = std::isfinite(dt_s) ? std::clamp(dt_s, 0.01, 2.0) : 0.25;
  const double power = std::isfinite(power_w) ? std::max(0.0, power_w) : 0.0;
  const double grade = std::isfinite(grade_percent) ? grade_percent : 0.0;
  const double speed = std::isfinite(speed_mps) ? std::max(0.0, speed_mps) : 0.0;
  clock_s_ += dt;

  target_ = target_cadence(power, grade);
  check_gear_shift_(target_, speed);

  double c_gear = gear_cadence_(speed, gear_);

  // Spin-out and coasting at speed
  const double kmh = speed * kMsToKmh;
  if (kmh > 55.0) {
    c_gear = (power < 150.0) ? 0.0 : std::min(110.0, c_gear);
  } else if (kmh > 45.0) {
    c_gear = (grade < -5.0) ? std::min(100.0, c_gear * 0.6) : std::min(120.0, c_gear);
  } else if (kmh > 35.0 && grade < -8.0) {
    c_gear = std::min(90.0, c_gear * 0.7);
  }
  if (speed < 1.5) c_gear = std::min(50.0, c_gear);

  const double alpha = 1.0 - std::exp(-dt / 0.8);
  base_ += alpha * (c_gear - base_);
  if (!std::isfinite(base_)) base_ = 85.0;

  update_noise_(dt);
  update_fatigue_(power, dt);

  cadence_ = std::clamp(base_ + noise_, 0.0, 180.0);
  return cadence_;
}

double CadenceManager::target_cadence(double power_w, double grade_percent) const {
  const double p = std::clamp(power_w, 0.0, 2000.0);
  const double g = std::clamp(grade_percent, -30.0, 30.0);
  const double c_power = prefs_.low_cadence +
      (prefs_.high_cadence - prefs_.low_cadence) / (1.0 + std::exp(-(p - prefs_.p50) / prefs_.k_p));
  const double drop_up = g > 0.0 ? prefs_.max_uphill_drop * (1.0 - std::exp(-g / prefs_.grade_scale)) : 0.0;
  const double bump_dn = g < -3.0 ? prefs_.max_down_bump * (1.0 - std::exp(-(std::fabs(g) - 3.0) / 3.0)) : 0.0;
  const double fatigue_drop = std::min(5.0, fatigue_ * 5.0);
  return std::clamp(c_power - drop_up + bump_dn - fatigue_drop, 40.0, 120.0);
}

double CadenceManager::gear_cadence_(double speed_mps, Gear g) const {
  if (speed_mps <= 0.5) return 0.0;
  return std::clamp(mechanical_cadence(speed_mps, prefs_.wheel_circumference_m, g.front, g.rear),
                    0.0, 180.0);
}

Gear CadenceManager::best_gear_for(double target_rpm, double speed_mps) const {
  if (speed_mps < 0.5) return Gear{0, 0};
  Gear best = gear_;
  double best_err = std::numeric_limits<double>::max();
  for (int f : gears_.chainrings) {
    for (int r : gears_.cassette) {
      const double err = std::fabs(gear_cadence_(speed_mps, Gear{f, r}) - target_rpm);
      if (err < best_err) { best_err = err; best = Gear{f, r}; }
    }
  }
  return best;
}

void CadenceManager::check_gear_shift_(double target_rpm, double speed_mps) {
  if (speed_mps < 0.5) return;
  const double c_gear = gear_cadence_(speed_mps, gear_);
  if (c_gear <= 0.0) return;
  // Inside the band: stay put.
  if (std::fabs(c_gear - target_rpm) <= kShiftBand) return;

  const Gear desired = best_gear_for(target_rpm, speed_mps);
  if (desired.front <= 0 || desired == gear_) return;

  // Rear first, one cog at a time.
  const int rear_idx = index_of(gears_.cassette, gear_.rear);
  const int want_idx = index_of(gears_.cassette, desired.rear);
  if (want_idx != rear_idx) {
    if (clock_s_ - last_rear_shift_s_ >= kRearCooldown) {
      const int step = want_idx > rear_idx ? 1 : -1;
      const int next = std::clamp(rear_idx + step, 0, static_cast<int>(gears_.cassette.size()) - 1);
      gear_.rear = gears_.cassette[next];
      last_rear_shift_s_ = clock_s_;
    }
    return;
  }
  if (desired.front != gear_.front && clock_s_ - last_front_shift_s_ >= kFrontCooldown) {
    gear_.front = desired.front;
    last_front_shift_s_ = clock_s_;
    base_ = std::max(0.0, base_ - kFrontShiftDip);
  }
}

void CadenceManager::update_noise_(double dt) {
  // OU jitter, bounded to +-2 rpm
  const double k = 2.0, sigma = 0.6;
  const double a = std::exp(-k * dt);
  noise_ = noise_ * a + sigma * std::sqrt(1.0 - a * a) * normal_(rng_);
  noise_ = std::clamp(noise_, -2.0, 2.0);
}

void CadenceManager::update_fatigue_(double power_w, double dt) {
  // 10 min at 110% FTP ~ +0.1; recovery tau 300 s below FTP
  const double frac = power_w / std::max(1.0, prefs_.ftp);
  if (frac > 1.0) {
    fatigue_ += (frac - 1.0) * dt / 600.0;
  } else {
    fatigue_ *= std::exp(-dt / 300.0);
  }
  fatigue_ = std::clamp(fatigue_, 0.0, 1.0);
}

CadenceState CadenceManager::state() const {
  return CadenceState{cadence_, target_, gear_, fatigue_, noise_};
}

void CadenceManager::reset() {
  gear_ = initial_gear_;
  base_ = 85.0;
  cadence_ = 85.0;
  target_ = 85.0;
  fatigue_ = 0.0;
  noise_ = 0.0;
  clock_s_ = 0.0;
  last_rear_shift_s_ = -1e9;
  last_front_shift_s_ = -1e9;
}

} // namespace cysim
