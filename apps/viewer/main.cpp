#include <cstdio>
#include <memory>
#include <cysim/config.hpp>
#include <cysim/diagnostics.hpp>
#include <cysim/sim_runner.hpp>
#include <cysim/viewer/app.hpp>

using namespace cysim;

int main(int argc, char** argv) {
  auto log = std::make_shared<DiagnosticLog>(1024, console_drain(stderr));
  log->start();

  RideConfig cfg;
  if (argc > 1) {
    if (auto loaded = load_ride_config_csv(argv[1])) {
      cfg = *loaded;
    } else {
      log->report_system("Could not open ride config, using defaults", {{"path", argv[1]}});
    }
  }

  SimRunner sim(cfg, log);
  sim.start();

  ViewerApp app(sim, log.get());
  const int code = app.run();

  sim.stop();
  log->stop();
  return code;
}
