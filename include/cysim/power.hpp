#pragma once
#include <deque>

namespace cysim {

struct PowerOptions {
  double trainer_tau_s    = 3.0;    // first-order response of the trainer
  double resting_tau_s    = 1.5;    // decay while coasting
  double low_cadence_rpm  = 50.0;   // below this, deliverable power is derated
  double max_power_w      = 2500.0;
  double display_window_s = 3.0;    // rolling average shown to the user
};

// Turns a requested wattage into what a rider on a trainer would actually
// produce: lagged, perturbed, capped by cadence, decaying when resting.
class PowerManager {
public:
  explicit PowerManager(PowerOptions opt = {});

  // Returns realistic watts (>= 0). dt_s is the step length in seconds.
  // Negative cadence_rpm means "unknown" and disables the cadence derate;
  // 0 rpm delivers nothing.
  int smooth(double target_power_w, double cadence_rpm, double perturbation_w,
             bool resting, double dt_s);

  double control_power() const { return control_; }
  // Mean over the last display_window_s of simulated time.
  double display_power() const;
  const PowerOptions& options() const { return opt_; }

  void reset();

private:
  struct Sample { double t; double v; };

  PowerOptions opt_;
  double control_ = 0.0;
  double clock_s_ = 0.0;
  std::deque<Sample> window_;
};

} // namespace cysim
