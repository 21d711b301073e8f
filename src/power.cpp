#include <cysim/power.hpp>
#include <algorithm>
#include <cmath>

namespace cysim {

PowerManager::PowerManager(PowerOptions opt) : opt_(opt) {}

int PowerManager::smooth(double target_power_w, double cadence_rpm, double perturbation_w,
                         bool resting, double dt_s) {
  const double dt = (std::isfinite(dt_s) && dt_s > 0.0) ? dt_s : 0.0;
  clock_s_ += dt;

  if (resting) {
    const double tau = std::max(1e-3, opt_.resting_tau_s);
    control_ *= std::exp(-dt / tau);
    if (control_ < 0.5) control_ = 0.0; // settles on the baseline
  } else {
    const double target = std::clamp(std::isfinite(target_power_w) ? target_power_w : 0.0,
                                     0.0, opt_.max_power_w);
    const double pert = std::isfinite(perturbation_w) ? perturbation_w : 0.0;
    double want = std::clamp(target + pert, 0.0, opt_.max_power_w);

    // Pedalling too slowly caps the torque that reaches the flywheel.
    if (cadence_rpm >= 0.0 && opt_.low_cadence_rpm > 0.0 && cadence_rpm < opt_.low_cadence_rpm) {
      want *= cadence_rpm / opt_.low_cadence_rpm;
    }

    const double tau = std::max(1e-3, opt_.trainer_tau_s);
    const double alpha = 1.0 - std::exp(-dt / tau);
    control_ += alpha * (want - control_);
  }
  if (!std::isfinite(control_)) control_ = 0.0;

  window_.push_back({clock_s_, control_});
  const double cutoff = clock_s_ - opt_.display_window_s;
  while (window_.size() > 1 && window_.front().t < cutoff) window_.pop_front();

  return std::max(0, static_cast<int>(std::lround(control_)));
}

double PowerManager::display_power() const {
  if (window_.empty()) return control_;
  double sum = 0.0;
  for (const auto& s : window_) sum += s.v;
  return sum / double(window_.size());
}

void PowerManager::reset() {
  control_ = 0.0;
  clock_s_ = 0.0;
  window_.clear();
}

} // namespace cysim
