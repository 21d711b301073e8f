#include <cysim/sim_runner.hpp>
#include <chrono>
#include <string>
#include <utility>

namespace cysim {

SimRunner::SimRunner(RideConfig config, std::shared_ptr<DiagnosticSink> sink)
  : config_(std::move(config)), sink_(std::move(sink)) {}

void SimRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
}

void SimRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void SimRunner::request_reset(ResetMode mode) {
  pending_reset_mode_.store(static_cast<int>(mode), std::memory_order_relaxed);
  pending_reset_.store(true, std::memory_order_release);
}

void SimRunner::thread_main_() {
  EngineOptions opt;
  opt.category = config_.category;
  opt.gearset = config_.gears;
  opt.rider = config_.rider;
  opt.power = config_.power;
  SimulationEngine engine(config_.physics, opt, sink_);

  if (sink_) {
    sink_->report("Simulation started", Severity::Info, Category::System,
                  {{"component", "SimRunner"}, {"rate_hz", "4"}});
  }

  using clock = std::chrono::steady_clock;
  const auto tick_ns = std::chrono::nanoseconds((long long)(1e9 / kTickHz));
  auto next = clock::now();
  double sim_time = 0.0;
  std::uint64_t tick = 0;

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_reset_.load(std::memory_order_acquire)) {
      pending_reset_.store(false, std::memory_order_relaxed);
      const auto mode = static_cast<ResetMode>(pending_reset_mode_.load(std::memory_order_relaxed));
      engine.reset(mode);
      if (mode == ResetMode::Full) { sim_time = 0.0; tick = 0; }
    }

    SimulationInput in;
    in.target_power = target_power.load(std::memory_order_relaxed);
    in.grade_percent = grade_percent.load(std::memory_order_relaxed);
    in.randomness = randomness.load(std::memory_order_relaxed);
    const int manual = manual_cadence.load(std::memory_order_relaxed);
    if (manual >= 0) in.manual_cadence = manual;
    in.is_resting = resting.load(std::memory_order_relaxed);

    const SimulationState st = engine.update(in);
    sim_time += engine.last_dt();
    ++tick;

    SimSnapshot s{};
    s.tick = tick;
    s.sim_time = sim_time;
    s.state = st;
    s.display_power = engine.display_power();
    s.target_power = in.target_power;
    s.grade_percent = in.grade_percent;
    s.randomness = in.randomness;
    s.manual_cadence = manual;
    s.resting = in.is_resting;
    buffer_.publish(s);

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }

  if (sink_) {
    sink_->report("Simulation stopped", Severity::Info, Category::System,
                  {{"component", "SimRunner"}, {"ticks", std::to_string(tick)}});
  }
}

} // namespace cysim
