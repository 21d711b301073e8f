#include <cstdio>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <cysim/config.hpp>
#include <cysim/diagnostics.hpp>
#include <cysim/engine.hpp>
#include <cysim/physics.hpp>

using namespace cysim;

// Usage: cysim_ride [config.csv|-] [seconds] [watts] [grade] [randomness]
// Prints one CSV row per 0.25 s tick of simulated time.

static std::optional<double> arg_double(int argc, char** argv, int i) {
  if (i >= argc) return std::nullopt;
  try {
    size_t idx = 0;
    const std::string s = argv[i];
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

int main(int argc, char** argv) {
  auto log = std::make_shared<DiagnosticLog>(256, console_drain(stderr));
  log->start();

  RideConfig cfg;
  if (argc > 1 && std::string(argv[1]) != "-") {
    auto loaded = load_ride_config_csv(argv[1]);
    if (!loaded) {
      log->report_system("Could not open ride config", {{"path", argv[1]}}, Severity::Critical);
      log->stop();
      return 1;
    }
    cfg = *loaded;
  }

  const double seconds    = arg_double(argc, argv, 2).value_or(60.0);
  const double watts      = arg_double(argc, argv, 3).value_or(200.0);
  const double grade      = arg_double(argc, argv, 4).value_or(0.0);
  const double randomness = arg_double(argc, argv, 5).value_or(0.0);

  // Virtual clock: the ride runs as fast as the CPU allows.
  constexpr double kDt = 0.25;
  double now = 0.0;

  EngineOptions opt;
  opt.category = cfg.category;
  opt.gearset = cfg.gears;
  opt.rider = cfg.rider;
  opt.power = cfg.power;
  SimulationEngine engine(cfg.physics, opt, log, [&now]{ return now; });

  SimulationInput in;
  in.target_power = static_cast<int>(watts);
  in.grade_percent = grade;
  in.randomness = static_cast<int>(randomness);

  // required_w: power that would hold the reported speed on this grade
  std::printf("t_s,power_w,required_w,speed_kmh,cadence_rpm,gear,target_cadence,fatigue,noise\n");
  const long ticks = seconds > 0.0 ? static_cast<long>(seconds / kDt) : 0;
  for (long i = 0; i < ticks; ++i) {
    now += kDt;
    const SimulationState st = engine.update(in);
    const double required = power_for_speed(st.speed_mps, grade, engine.physics_params());
    std::printf("%.2f,%d,%.1f,%.2f,%d,%dx%d,%.1f,%.4f,%.3f\n",
                now, st.power_watts, required, st.speed_mps * kMsToKmh, st.cadence_rpm,
                st.gear.front, st.gear.rear, st.target_cadence, st.fatigue, st.noise);
  }

  log->stop();
  return 0;
}
