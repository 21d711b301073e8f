#include <catch2/catch_test_macros.hpp>
#include <cysim/snap.hpp>
#include <cysim/snap_buffer.hpp>

using namespace cysim;

TEST_CASE("SnapshotBuffer publishes and consumes latest") {
  SnapshotBuffer buf;
  SimSnapshot s; s.tick = 1; s.state.power_watts = 180;
  buf.publish(s);

  uint64_t cursor = 0;
  SimSnapshot out{};
  // Should see new data
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out.tick == 1);
  REQUIRE(out.state.power_watts == 180);
  // Second call without publish should return false
  REQUIRE_FALSE(buf.try_consume_latest(cursor, out));
}

TEST_CASE("SnapshotBuffer only keeps the newest") {
  SnapshotBuffer buf;
  for (uint64_t t = 1; t <= 3; ++t) {
    SimSnapshot s; s.tick = t;
    buf.publish(s);
  }
  REQUIRE(buf.sequence() == 3);

  uint64_t cursor = 0;
  SimSnapshot out{};
  REQUIRE(buf.try_consume_latest(cursor, out));
  REQUIRE(out.tick == 3);
  REQUIRE(cursor == 3);
}
