#include <cysim/engine.hpp>
#include <chrono>
#include <cmath>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace cysim {

namespace {

std::uint32_t resolve_seed(std::uint32_t seed) {
  return seed != 0 ? seed : std::random_device{}();
}

template <class T>
std::string str(T v) {
  std::ostringstream os;
  os << v;
  return os.str();
}

} // namespace

Clock steady_clock_seconds() {
  return [] {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
  };
}

SimulationEngine::SimulationEngine(PhysicsParams params, EngineOptions opt,
                                   std::shared_ptr<DiagnosticSink> sink, Clock clock)
  : params_(params),
    opt_(std::move(opt)),
    sink_(sink ? std::move(sink) : std::make_shared<NullSink>()),
    clock_(clock ? std::move(clock) : steady_clock_seconds()),
    variance_(resolve_seed(opt_.seed)),
    power_(opt_.power),
    // offset keeps the two generators apart under a fixed seed
    cadence_(opt_.gearset, opt_.rider, resolve_seed(opt_.seed == 0 ? 0 : opt_.seed + 7919u)) {
  last_tick_s_ = clock_();
}

void SimulationEngine::warn_if_invalid_(const ValidationResult& r, bool was_clamped,
                                        const char* what, Context context) {
  if (r.is_valid() && !was_clamped) return;
  context["component"] = "SimulationEngine";
  std::string msg = std::string(what) + " validation - ";
  msg += r.is_valid() ? std::string("value clamped to safe range") : r.message;
  sink_->report_validation(std::move(msg), std::move(context));
}

SimulationState SimulationEngine::update(const SimulationInput& in) {
  const double now = clock_();
  const double floor = opt_.dt_floor_s > 0.0 ? opt_.dt_floor_s : 0.001;
  double dt = now - last_tick_s_;
  if (!std::isfinite(dt) || dt < floor) dt = floor;
  last_tick_s_ = now;
  last_dt_ = dt;
  ++ticks_;

  // Clamp first, unconditionally.
  const double raw_power = double(in.target_power);
  const double raw_rand  = double(in.randomness);
  const double safe_power = ValueValidator::clamp(raw_power, ParamKind::Power);
  const double safe_grade = ValueValidator::clamp(in.grade_percent, ParamKind::Gradient);
  const double safe_rand  = ValueValidator::clamp(raw_rand, ParamKind::Randomness);
  std::optional<double> safe_cadence;
  if (in.manual_cadence) {
    safe_cadence = ValueValidator::clamp(double(*in.manual_cadence), ParamKind::Cadence);
  }

  // Diagnostics only; the pipeline continues with the clamped values.
  const ValueValidator validator(opt_.category);
  warn_if_invalid_(validator.validate_power(safe_power), safe_power != raw_power, "Power",
                   {{"originalPower", str(in.target_power)}, {"safePower", str(safe_power)}});
  warn_if_invalid_(validator.validate_gradient(safe_grade), safe_grade != in.grade_percent, "Grade",
                   {{"originalGrade", str(in.grade_percent)}, {"safeGrade", str(safe_grade)}});
  warn_if_invalid_(validator.validate_randomness(safe_rand), safe_rand != raw_rand, "Randomness",
                   {{"originalRandomness", str(in.randomness)}, {"safeRandomness", str(safe_rand)}});
  if (safe_cadence) {
    warn_if_invalid_(validator.validate_cadence(*safe_cadence, safe_power),
                     *safe_cadence != double(*in.manual_cadence), "Cadence",
                     {{"originalCadence", str(*in.manual_cadence)},
                      {"validatedCadence", str(*safe_cadence)},
                      {"power", str(safe_power)}});
  }

  const double perturbation = variance_.advance(safe_rand, safe_power, dt);
  const double cadence_hint = safe_cadence.value_or(opt_.default_cadence_hint);
  const int watts = power_.smooth(safe_power, cadence_hint, perturbation, in.is_resting, dt);
  const double speed = speed_from_power(double(watts), safe_grade, params_);

  // The cadence model runs in both modes so gear and fatigue keep evolving.
  const double auto_cadence = cadence_.update(double(watts), safe_grade, speed, dt);
  const int cadence_rpm = safe_cadence ? static_cast<int>(std::lround(*safe_cadence))
                                       : static_cast<int>(std::lround(auto_cadence));

  const CadenceState cs = cadence_.state();
  SimulationState out;
  out.power_watts = watts;
  out.speed_mps = speed;
  out.cadence_rpm = cadence_rpm;
  out.fatigue = cs.fatigue;
  out.noise = cs.noise;
  out.gear = cs.gear;
  out.target_cadence = cs.target;
  return out;
}

void SimulationEngine::reset() { reset(opt_.reset_mode); }

void SimulationEngine::reset(ResetMode mode) {
  last_tick_s_ = clock_();
  last_dt_ = 0.0;
  if (mode == ResetMode::Full) {
    variance_.reset();
    power_.reset();
    cadence_.reset();
    ticks_ = 0;
  }
}

} // namespace cysim
