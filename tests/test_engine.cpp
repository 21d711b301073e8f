#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <memory>

#include <cysim/engine.hpp>

using Catch::Approx;
using namespace cysim;

namespace {

// Manually advanced clock shared with the engine
struct FakeClock {
  std::shared_ptr<double> now = std::make_shared<double>(0.0);
  Clock fn() const { auto n = now; return [n]{ return *n; }; }
  void advance(double s) { *now += s; }
};

EngineOptions seeded(std::uint32_t seed = 17) {
  EngineOptions opt;
  opt.seed = seed;
  return opt;
}

} // namespace

TEST_CASE("engine converges on a steady 200 W ride") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());

  SimulationInput in;
  in.target_power = 200;
  SimulationState st;
  for (int i = 0; i < 240; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
  }
  REQUIRE(engine.last_dt() == Approx(0.25));
  REQUIRE(engine.tick_count() == 240);
  REQUIRE(st.power_watts == 200);
  REQUIRE(st.speed_mps * kMsToKmh == Approx(34.0).margin(2.0));
  REQUIRE(st.cadence_rpm > 70);
  REQUIRE(st.cadence_rpm < 100);
  REQUIRE(st.gear.front > 0);
  REQUIRE(st.gear.rear > 0);
  REQUIRE(st.fatigue == Approx(0.0));
  REQUIRE(std::fabs(st.noise) <= 2.0);
  REQUIRE(engine.display_power() == Approx(200.0).margin(1.0));
}

TEST_CASE("back-to-back updates use the dt floor") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());
  SimulationInput in;
  in.target_power = 250;
  in.randomness = 100;
  for (int i = 0; i < 50; ++i) {
    const auto st = engine.update(in); // clock never moves
    REQUIRE(engine.last_dt() == Approx(0.001));
    REQUIRE(std::isfinite(st.speed_mps));
    REQUIRE(std::isfinite(st.fatigue));
    REQUIRE(st.power_watts >= 0);
  }

  // a clock running backwards is treated the same way
  clk.advance(-5.0);
  (void)engine.update(in);
  REQUIRE(engine.last_dt() == Approx(0.001));
}

TEST_CASE("manual cadence passes through while the rider model keeps running") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());
  SimulationInput in;
  in.target_power = 350;
  in.manual_cadence = 95;
  SimulationState st;
  for (int i = 0; i < 480; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
    REQUIRE(st.cadence_rpm == 95);
  }
  REQUIRE(st.fatigue > 0.0);
  REQUIRE(st.target_cadence > 0.0);
}

TEST_CASE("manual cadence of zero delivers no power") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());
  SimulationInput in;
  in.target_power = 300;
  in.manual_cadence = 0;
  SimulationState st;
  for (int i = 0; i < 200; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
  }
  REQUIRE(st.cadence_rpm == 0);
  REQUIRE(st.power_watts == 0);
  REQUIRE(st.speed_mps == Approx(0.0));

  // slow but turning cranks deliver a little, monotonically more
  in.manual_cadence = 10;
  for (int i = 0; i < 200; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
  }
  REQUIRE(st.power_watts == Approx(60).margin(1));
}

TEST_CASE("NaN grade rides flat and is reported") {
  FakeClock clk;
  auto log = std::make_shared<DiagnosticLog>(64);
  SimulationEngine engine(PhysicsParams{}, seeded(), log, clk.fn());
  SimulationInput in;
  in.target_power = 0;
  in.grade_percent = std::nan("");
  SimulationState st;
  for (int i = 0; i < 40; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
    REQUIRE(st.speed_mps == Approx(0.0));
  }

  in.target_power = 200;
  for (int i = 0; i < 200; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
  }
  REQUIRE(st.speed_mps == Approx(speed_from_power(200.0, 0.0, engine.physics_params())).margin(0.05));

  log->flush();
  const auto warnings = log->entries(Severity::Warning, Category::Validation);
  REQUIRE_FALSE(warnings.empty());
  REQUIRE(warnings.front().context.at("safeGrade") == "0");
}

TEST_CASE("heavy rider at 500 W on 15% crawls") {
  FakeClock clk;
  PhysicsParams p;
  p.mass_kg = 1000.0;
  SimulationEngine engine(p, seeded(), nullptr, clk.fn());
  REQUIRE(engine.physics_params().mass_kg == Approx(1000.0));
  SimulationInput in;
  in.target_power = 500;
  in.grade_percent = 15.0;
  SimulationState st;
  for (int i = 0; i < 120; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
    REQUIRE(st.speed_mps < 0.5);
  }
  REQUIRE(st.power_watts == Approx(500).margin(2));
}

TEST_CASE("resting drains power towards zero") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());
  SimulationInput in;
  in.target_power = 300;
  for (int i = 0; i < 120; ++i) { clk.advance(0.25); (void)engine.update(in); }

  in.is_resting = true;
  int prev = 1 << 30;
  SimulationState st;
  for (int i = 0; i < 120; ++i) {
    clk.advance(0.25);
    st = engine.update(in);
    REQUIRE(st.power_watts <= prev);
    prev = st.power_watts;
  }
  REQUIRE(st.power_watts == 0);
  REQUIRE(st.speed_mps == Approx(0.0));
}

TEST_CASE("out of range inputs are clamped and reported") {
  FakeClock clk;
  auto log = std::make_shared<DiagnosticLog>(64);
  SimulationEngine engine(PhysicsParams{}, seeded(), log, clk.fn());

  SECTION("valid input stays quiet") {
    SimulationInput in;
    in.target_power = 200;
    clk.advance(0.25);
    (void)engine.update(in);
    log->flush();
    REQUIRE(log->entries().empty());
  }

  SECTION("each clamped field gets its own warning") {
    SimulationInput in;
    in.target_power = 5000;
    in.grade_percent = 45.0;
    in.randomness = 150;
    in.manual_cadence = 250;
    clk.advance(0.25);
    const auto st = engine.update(in);
    REQUIRE(st.cadence_rpm == 180);
    REQUIRE(st.power_watts <= 2000);

    log->flush();
    const auto warnings = log->entries(Severity::Warning, Category::Validation);
    REQUIRE(warnings.size() == 4);
    for (const auto& e : warnings) {
      REQUIRE(e.context.at("component") == "SimulationEngine");
    }
    REQUIRE(warnings[0].context.at("originalPower") == "5000");
    REQUIRE(warnings[0].context.at("safePower") == "2000");
    REQUIRE(warnings[1].context.at("safeGrade") == "30");
    REQUIRE(warnings[3].context.at("validatedCadence") == "180");
  }

  SECTION("implausible but in-range values still warn") {
    SimulationInput in;
    in.target_power = 1500; // sprint territory for an enthusiast
    clk.advance(0.25);
    (void)engine.update(in);
    log->flush();
    REQUIRE(log->entries().size() == 1);
    REQUIRE(log->entries().front().message.find("Power") == 0);
  }
}

TEST_CASE("reset modes") {
  FakeClock clk;
  SimulationEngine engine(PhysicsParams{}, seeded(), nullptr, clk.fn());
  SimulationInput in;
  in.target_power = 400;
  for (int i = 0; i < 480; ++i) { clk.advance(0.25); (void)engine.update(in); }

  SECTION("time cursor only keeps the rider state") {
    clk.advance(30.0); // long pause
    engine.reset(ResetMode::TimeCursorOnly);
    clk.advance(0.25);
    const auto st = engine.update(in);
    REQUIRE(engine.last_dt() == Approx(0.25));
    REQUIRE(st.fatigue > 0.0);
    REQUIRE(st.power_watts == Approx(400).margin(2));
    REQUIRE(engine.tick_count() == 481);
  }

  SECTION("default reset follows the configured mode") {
    EngineOptions opt = seeded();
    opt.reset_mode = ResetMode::Full;
    SimulationEngine full(PhysicsParams{}, opt, nullptr, clk.fn());
    for (int i = 0; i < 480; ++i) { clk.advance(0.25); (void)full.update(in); }
    full.reset();
    REQUIRE(full.tick_count() == 0);
    REQUIRE(full.display_power() == Approx(0.0));

    clk.advance(0.25);
    const auto st = full.update(in);
    REQUIRE(st.fatigue == Approx(0.0));
    REQUIRE(st.power_watts < 100);
  }
}

TEST_CASE("fixed seed makes runs reproducible") {
  FakeClock a, b;
  SimulationEngine ea(PhysicsParams{}, seeded(99), nullptr, a.fn());
  SimulationEngine eb(PhysicsParams{}, seeded(99), nullptr, b.fn());
  SimulationInput in;
  in.target_power = 220;
  in.randomness = 60;
  for (int i = 0; i < 100; ++i) {
    a.advance(0.25);
    b.advance(0.25);
    const auto sa = ea.update(in);
    const auto sb = eb.update(in);
    REQUIRE(sa.power_watts == sb.power_watts);
    REQUIRE(sa.cadence_rpm == sb.cadence_rpm);
    REQUIRE(sa.gear == sb.gear);
  }
}
