#pragma once
#include <optional>
#include <string>
#include <vector>

namespace cysim {

enum class ParamKind : int {
  Power = 0,     // watts
  Gradient,      // percent
  Randomness,    // 0..100
  Cadence,       // rpm
  Speed,         // m/s
};

enum class ValidationLevel : int { Valid = 0, Warning, Error, Critical };

struct ValidationResult {
  ValidationLevel level = ValidationLevel::Valid;
  std::string message;
  std::string parameter;
  bool is_valid() const { return level == ValidationLevel::Valid; }
};

enum class RiderCategory : int {
  Recreational = 0, // < 200 W FTP
  Enthusiast,       // 200-250 W
  Competitive,      // 250-350 W
  Elite,            // 350-450 W
  Professional,     // > 450 W
};

double max_sustained_power(RiderCategory c);
double max_sprint_power(RiderCategory c);

struct SafetyLimits {
  double min = 0.0;
  double max = 0.0;
  double recommended_min = 0.0;
  double recommended_max = 0.0;
};

const char* to_string(ParamKind k);
const char* to_string(ValidationLevel l);

// Range checks for simulation inputs. Stateless apart from the rider
// category; cheap to construct per call.
class ValueValidator {
public:
  explicit ValueValidator(RiderCategory category = RiderCategory::Enthusiast)
    : category_(category) {}

  RiderCategory category() const { return category_; }

  static SafetyLimits safety_limits(ParamKind kind);

  // Always lands inside safety_limits(kind). NaN maps to 0 (flat road, no
  // effort), never to a bound.
  static double clamp(double raw, ParamKind kind);

  // duration_s < 10 is judged as a sprint, > 60 as sustained.
  ValidationResult validate_power(double watts, double duration_s = 0.0) const;
  ValidationResult validate_gradient(double grade_percent) const;
  ValidationResult validate_randomness(double level) const;
  // Plausibility depends on the power the cadence is delivered at.
  ValidationResult validate_cadence(double rpm, double power_w = 0.0) const;
  ValidationResult validate_speed(double speed_mps, double power_w, double grade_percent) const;

  // Per-field checks plus cross-field consistency; only non-valid results.
  std::vector<ValidationResult> validate_state(double power_w,
                                               double speed_mps,
                                               double cadence_rpm,
                                               double grade_percent,
                                               double duration_s = 0.0) const;

private:
  RiderCategory category_;
};

} // namespace cysim
