#include <cysim/variance.hpp>
#include <algorithm>
#include <cmath>

namespace cysim {

VarianceProcess::VarianceProcess(std::uint32_t seed) : rng_(seed) {}

double VarianceProcess::min_fraction(double p) {
  return -std::min(0.20, 60.0 / std::max(120.0, p));
}

double VarianceProcess::max_fraction(double p) {
  return std::min(0.20, 80.0 / std::max(120.0, p));
}

double VarianceProcess::advance(double randomness, double target_power_w, double dt_s) {
  const double level = std::isfinite(randomness) ? std::clamp(randomness, 0.0, 100.0) : 0.0;
  const double power = std::isfinite(target_power_w) ? std::max(0.0, target_power_w) : 0.0;
  if (level <= 0.0) {
    reset();
    return 0.0;
  }
  const double dt = std::isfinite(dt_s) ? std::clamp(dt_s, kMinDt, kMaxDt) : kMinDt;

  // randomness 100 -> 10% coefficient of variation
  const double cv = level / 1000.0;
  const double cv_micro = cv * std::sqrt(kWeightMicro);
  const double cv_macro = cv * std::sqrt(kWeightMacro);
  const double cv_event = cv * std::sqrt(kWeightEvent);

  // Exact OU step: stationary std stays at cv_* for any dt.
  const double a_micro = std::exp(-dt / kTauMicro);
  x_micro_ = x_micro_ * a_micro + cv_micro * std::sqrt(1.0 - a_micro * a_micro) * randn_();
  const double a_macro = std::exp(-dt / kTauMacro);
  x_macro_ = x_macro_ * a_macro + cv_macro * std::sqrt(1.0 - a_macro * a_macro) * randn_();

  // Poisson arrivals: 0.2..2.0 events per minute
  const double lambda = (0.2 + 1.8 * (level / 100.0)) / 60.0;
  const double p_event = 1.0 - std::exp(-lambda * dt);
  if (!event_active_ && uniform_(rng_) < p_event) {
    const double cap = std::min(0.10, 25.0 / std::max(100.0, power));
    event_value_ = std::clamp(cv_event * 2.0 * randn_(), -cap, cap);
    event_timer_ = 0.5 + 1.5 * uniform_(rng_);
    event_active_ = true;
  }
  if (event_active_) {
    event_timer_ -= dt;
    if (event_timer_ <= 0.0) {
      event_active_ = false;
      event_timer_ = 0.0;
      event_value_ = 0.0;
    }
  }

  const double total = x_micro_ + x_macro_ + (event_active_ ? event_value_ : 0.0);
  const double frac = std::clamp(total, min_fraction(power), max_fraction(power));
  return frac * power;
}

void VarianceProcess::reset() {
  x_micro_ = 0.0;
  x_macro_ = 0.0;
  event_active_ = false;
  event_timer_ = 0.0;
  event_value_ = 0.0;
}

VarianceProcess::State VarianceProcess::state() const {
  return State{x_micro_, x_macro_, event_active_ ? event_value_ : 0.0, event_active_, event_timer_};
}

} // namespace cysim
