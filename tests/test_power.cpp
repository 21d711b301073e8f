#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cysim/power.hpp>

using Catch::Approx;
using namespace cysim;

TEST_CASE("PowerManager follows the target with trainer lag") {
  PowerManager pm;
  const int first = pm.smooth(200.0, 90.0, 0.0, false, 0.25);
  REQUIRE(first > 0);
  REQUIRE(first < 200);

  int w = first;
  for (int i = 0; i < 160; ++i) w = pm.smooth(200.0, 90.0, 0.0, false, 0.25);
  REQUIRE(w == 200);
  REQUIRE(pm.control_power() == Approx(200.0).margin(0.5));
}

TEST_CASE("perturbation shifts the level the trainer settles at") {
  PowerManager pm;
  int w = 0;
  for (int i = 0; i < 160; ++i) w = pm.smooth(200.0, 90.0, 20.0, false, 0.25);
  REQUIRE(w == 220);
}

TEST_CASE("resting decays monotonically to zero") {
  PowerManager pm;
  for (int i = 0; i < 160; ++i) (void)pm.smooth(300.0, 90.0, 0.0, false, 0.25);

  int prev = 300;
  int w = prev;
  for (int i = 0; i < 80; ++i) {
    w = pm.smooth(300.0, 90.0, 0.0, true, 0.25);
    REQUIRE(w <= prev);
    prev = w;
  }
  REQUIRE(w == 0);
}

TEST_CASE("low cadence derates deliverable power") {
  PowerManager slow, normal;
  int ws = 0, wn = 0;
  for (int i = 0; i < 160; ++i) {
    ws = slow.smooth(300.0, 25.0, 0.0, false, 0.25);
    wn = normal.smooth(300.0, 90.0, 0.0, false, 0.25);
  }
  REQUIRE(wn == 300);
  REQUIRE(ws == 150); // 25 / 50 of the request

  // Unknown cadence does not derate
  PowerManager unknown;
  int wu = 0;
  for (int i = 0; i < 160; ++i) wu = unknown.smooth(300.0, -1.0, 0.0, false, 0.25);
  REQUIRE(wu == 300);
}

TEST_CASE("derate is monotone down to a standstill crank") {
  int prev = -1;
  for (double rpm : {0.0, 1.0, 10.0, 25.0, 50.0, 90.0}) {
    PowerManager pm;
    int w = 0;
    for (int i = 0; i < 160; ++i) w = pm.smooth(300.0, rpm, 0.0, false, 0.25);
    REQUIRE(w >= prev);
    prev = w;
  }

  PowerManager stopped;
  int w = 0;
  for (int i = 0; i < 160; ++i) w = stopped.smooth(300.0, 0.0, 0.0, false, 0.25);
  REQUIRE(w == 0);
}

TEST_CASE("output is capped and never negative") {
  PowerManager pm;
  int w = 0;
  for (int i = 0; i < 160; ++i) w = pm.smooth(5000.0, 90.0, 0.0, false, 0.25);
  REQUIRE(w == 2500);

  pm.reset();
  for (int i = 0; i < 20; ++i) REQUIRE(pm.smooth(-100.0, 90.0, -50.0, false, 0.25) == 0);
}

TEST_CASE("display power averages the recent window") {
  PowerOptions opt;
  opt.display_window_s = 1.0;
  PowerManager pm(opt);
  for (int i = 0; i < 200; ++i) (void)pm.smooth(200.0, 90.0, 0.0, false, 0.25);
  REQUIRE(pm.display_power() == Approx(200.0).margin(0.5));

  pm.reset();
  REQUIRE(pm.display_power() == Approx(0.0));
  REQUIRE(pm.control_power() == Approx(0.0));
}
