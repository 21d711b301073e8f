#include <cysim/validator.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>

namespace cysim {

static inline ValidationResult make(ValidationLevel lvl, const char* msg, const char* param) {
  return ValidationResult{lvl, msg, param};
}

double max_sustained_power(RiderCategory c) {
  switch (c) {
    case RiderCategory::Recreational: return 250.0;
    case RiderCategory::Enthusiast:   return 350.0;
    case RiderCategory::Competitive:  return 450.0;
    case RiderCategory::Elite:        return 550.0;
    case RiderCategory::Professional: return 650.0;
  }
  return 350.0;
}

double max_sprint_power(RiderCategory c) {
  switch (c) {
    case RiderCategory::Recreational: return 600.0;
    case RiderCategory::Enthusiast:   return 900.0;
    case RiderCategory::Competitive:  return 1200.0;
    case RiderCategory::Elite:        return 1500.0;
    case RiderCategory::Professional: return 2000.0;
  }
  return 900.0;
}

const char* to_string(ParamKind k) {
  switch (k) {
    case ParamKind::Power:      return "power";
    case ParamKind::Gradient:   return "gradient";
    case ParamKind::Randomness: return "randomness";
    case ParamKind::Cadence:    return "cadence";
    case ParamKind::Speed:      return "speed";
  }
  return "unknown";
}

const char* to_string(ValidationLevel l) {
  switch (l) {
    case ValidationLevel::Valid:    return "Valid";
    case ValidationLevel::Warning:  return "Warning";
    case ValidationLevel::Error:    return "Error";
    case ValidationLevel::Critical: return "Critical";
  }
  return "Unknown";
}

SafetyLimits ValueValidator::safety_limits(ParamKind kind) {
  switch (kind) {
    case ParamKind::Power:      return {0.0, 2000.0, 50.0, 400.0};
    case ParamKind::Gradient:   return {-30.0, 30.0, -10.0, 10.0};
    case ParamKind::Randomness: return {0.0, 100.0, 0.0, 50.0};
    case ParamKind::Cadence:    return {0.0, 180.0, 70.0, 100.0};
    case ParamKind::Speed:      return {0.0, 30.0, 5.0, 15.0};
  }
  return {0.0, 0.0, 0.0, 0.0};
}

double ValueValidator::clamp(double raw, ParamKind kind) {
  const SafetyLimits l = safety_limits(kind);
  if (std::isnan(raw)) return std::clamp(0.0, l.min, l.max);
  return std::clamp(raw, l.min, l.max);
}

ValidationResult ValueValidator::validate_power(double watts, double duration_s) const {
  if (watts < 0.0) return make(ValidationLevel::Error, "Power cannot be negative", "power");
  if (watts > 2600.0) return make(ValidationLevel::Critical, "Power exceeds world record levels", "power");

  if (duration_s < 10.0) {
    if (watts > max_sprint_power(category_))
      return make(ValidationLevel::Warning, "Sprint power exceeds typical for category", "power");
  } else if (duration_s > 60.0) {
    if (watts > max_sustained_power(category_))
      return make(ValidationLevel::Warning, "Sustained power exceeds typical for category", "power");
  }
  return make(ValidationLevel::Valid, "Power within normal range", "power");
}

ValidationResult ValueValidator::validate_gradient(double g) const {
  if (std::fabs(g) > 40.0) return make(ValidationLevel::Critical, "Gradient exceeds road limits", "gradient");
  if (std::fabs(g) > 30.0) return make(ValidationLevel::Warning, "Extreme gradient", "gradient");
  if (g > 20.0)  return make(ValidationLevel::Warning, "Very steep climb", "gradient");
  if (g < -20.0) return make(ValidationLevel::Warning, "Very steep descent", "gradient");
  return make(ValidationLevel::Valid, "Gradient within normal range", "gradient");
}

ValidationResult ValueValidator::validate_randomness(double level) const {
  if (level < 0.0 || level > 100.0)
    return make(ValidationLevel::Warning, "Randomness outside 0-100", "randomness");
  return make(ValidationLevel::Valid, "Randomness within normal range", "randomness");
}

ValidationResult ValueValidator::validate_cadence(double rpm, double power_w) const {
  if (rpm < 0.0)   return make(ValidationLevel::Error, "Cadence cannot be negative", "cadence");
  if (rpm > 200.0) return make(ValidationLevel::Critical, "Cadence exceeds human limits", "cadence");
  if (rpm > 140.0) return make(ValidationLevel::Warning, "Very high cadence", "cadence");
  if (rpm > 0.0 && rpm < 30.0) return make(ValidationLevel::Warning, "Very low cadence", "cadence");
  if (power_w > 300.0 && rpm < 60.0)
    return make(ValidationLevel::Warning, "Low cadence for high power", "cadence");
  if (power_w < 100.0 && rpm > 110.0)
    return make(ValidationLevel::Warning, "High cadence for low power", "cadence");
  return make(ValidationLevel::Valid, "Cadence within normal range", "cadence");
}

ValidationResult ValueValidator::validate_speed(double v, double power_w, double grade) const {
  const double kmh = v * 3.6;
  if (v < 0.0)     return make(ValidationLevel::Error, "Speed cannot be negative", "speed");
  if (kmh > 140.0) return make(ValidationLevel::Critical, "Speed exceeds world record", "speed");

  if (grade > 10.0) {
    if (kmh > 25.0) return make(ValidationLevel::Warning, "Speed too high for steep gradient", "speed");
    if (power_w < 150.0 && kmh > 10.0)
      return make(ValidationLevel::Warning, "Speed inconsistent with low power on climb", "speed");
  } else if (grade < -10.0) {
    if (kmh < 30.0 && power_w < 50.0)
      return make(ValidationLevel::Warning, "Speed too low for steep descent", "speed");
    if (kmh > 100.0) return make(ValidationLevel::Warning, "Dangerous descent speed", "speed");
  } else {
    if (power_w > 300.0 && kmh < 25.0)
      return make(ValidationLevel::Warning, "Speed too low for power output", "speed");
    if (power_w < 100.0 && kmh > 40.0)
      return make(ValidationLevel::Warning, "Speed too high for power output", "speed");
  }
  return make(ValidationLevel::Valid, "Speed reasonable for conditions", "speed");
}

std::vector<ValidationResult> ValueValidator::validate_state(double power_w,
                                                             double speed_mps,
                                                             double cadence_rpm,
                                                             double grade_percent,
                                                             double duration_s) const {
  std::vector<ValidationResult> all{
    validate_power(power_w, duration_s),
    validate_speed(speed_mps, power_w, grade_percent),
    validate_cadence(cadence_rpm, power_w),
    validate_gradient(grade_percent),
  };

  if (power_w > 200.0 && speed_mps < 2.0 && std::fabs(grade_percent) < 5.0) {
    all.push_back(make(ValidationLevel::Warning,
                       "High power but low speed on moderate gradient", "power-speed"));
  }
  if (cadence_rpm > 100.0 && speed_mps < 3.0 && power_w > 100.0) {
    all.push_back(make(ValidationLevel::Warning, "High cadence but low speed", "cadence-speed"));
  }

  std::vector<ValidationResult> out;
  std::copy_if(all.begin(), all.end(), std::back_inserter(out),
               [](const ValidationResult& r){ return !r.is_valid(); });
  return out;
}

} // namespace cysim
