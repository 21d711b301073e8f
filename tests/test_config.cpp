#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <cysim/config.hpp>

using Catch::Approx;
using namespace cysim;

static std::string csv_minimal = R"(key,value
mass_kg,82
cda,0.28
ftp,300
category,competitive
)";

static std::string csv_with_noise = R"( key , value
# rider
mass_kg , 68.5
efficiency , 1.5
ftp , -20
crr , abc
chainrings , 53;39
cassette , 28;11;25;12;14
, ,
unknown_key , 4
category , nonsense
wheel_circumference_m , 2.096
)";

TEST_CASE("ride_config_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_minimal);
  const auto cfg = ride_config_from_csv_stream(ss);
  REQUIRE(cfg.physics.mass_kg == Approx(82.0));
  REQUIRE(cfg.physics.cda == Approx(0.28));
  REQUIRE(cfg.rider.ftp == Approx(300.0));
  REQUIRE(cfg.category == RiderCategory::Competitive);
  // untouched keys keep their defaults
  REQUIRE(cfg.physics.crr == Approx(PhysicsParams{}.crr));
  REQUIRE(cfg.gears.cassette == Gearset{}.cassette);
}

TEST_CASE("ride_config_from_csv_stream skips bad rows and tolerates whitespace") {
  std::istringstream ss(csv_with_noise);
  const auto cfg = ride_config_from_csv_stream(ss);
  REQUIRE(cfg.physics.mass_kg == Approx(68.5));
  REQUIRE(cfg.physics.efficiency == Approx(PhysicsParams{}.efficiency)); // > 1 rejected
  REQUIRE(cfg.rider.ftp == Approx(RiderPrefs{}.ftp));                    // negative rejected
  REQUIRE(cfg.physics.crr == Approx(PhysicsParams{}.crr));               // not a number
  REQUIRE(cfg.gears.chainrings == std::vector<int>{53, 39});
  REQUIRE(cfg.gears.cassette == std::vector<int>{11, 12, 14, 25, 28});   // sorted
  REQUIRE(cfg.category == RiderCategory::Enthusiast);
  REQUIRE(cfg.rider.wheel_circumference_m == Approx(2.096));
}

TEST_CASE("gear lists with bad tooth counts are ignored") {
  std::istringstream ss("chainrings,50;0\ncassette,11;12.5\n");
  const auto cfg = ride_config_from_csv_stream(ss);
  REQUIRE(cfg.gears.chainrings == Gearset{}.chainrings);
  REQUIRE(cfg.gears.cassette == Gearset{}.cassette);
}

TEST_CASE("rider_category_from_string") {
  REQUIRE(rider_category_from_string("Elite") == RiderCategory::Elite);
  REQUIRE(rider_category_from_string(" pro ") == RiderCategory::Professional);
  REQUIRE_FALSE(rider_category_from_string("").has_value());
}

TEST_CASE("load_ride_config_csv returns nullopt for missing file") {
  REQUIRE_FALSE(load_ride_config_csv("/definitely/not/here.csv").has_value());
}
