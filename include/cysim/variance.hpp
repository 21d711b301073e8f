#pragma once
#include <cstdint>
#include <random>

namespace cysim {

// Mean-reverting power fluctuation. Two Ornstein-Uhlenbeck components
// (fast pedalling noise, slow effort drift) plus short discrete events
// share a variance budget derived from the randomness level.
class VarianceProcess {
public:
  struct State {
    double micro = 0.0;        // fraction of target power
    double macro = 0.0;
    double event = 0.0;
    bool   event_active = false;
    double event_timer_s = 0.0;
  };

  explicit VarianceProcess(std::uint32_t seed = std::random_device{}());

  // Perturbation in watts for this step. randomness is 0..100;
  // 0 clears the state and yields exactly 0.
  double advance(double randomness, double target_power_w, double dt_s);

  void reset();
  State state() const;
  void seed(std::uint32_t s) { rng_.seed(s); reset(); }

  // Clamp window for the summed fraction at a given target power.
  static double min_fraction(double target_power_w);
  static double max_fraction(double target_power_w);

private:
  double randn_() { return normal_(rng_); }

  static constexpr double kWeightMicro = 0.50;
  static constexpr double kWeightMacro = 0.35;
  static constexpr double kWeightEvent = 0.15;
  static constexpr double kTauMicro = 0.167;  // s
  static constexpr double kTauMacro = 3.33;   // s
  static constexpr double kMaxDt = 10.0;      // s
  static constexpr double kMinDt = 1e-3;      // s

  std::mt19937 rng_;
  std::normal_distribution<double> normal_{0.0, 1.0};
  std::uniform_real_distribution<double> uniform_{0.0, 1.0};

  double x_micro_ = 0.0;
  double x_macro_ = 0.0;
  bool   event_active_ = false;
  double event_timer_ = 0.0;
  double event_value_ = 0.0;
};

} // namespace cysim
