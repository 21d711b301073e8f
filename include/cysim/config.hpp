#pragma once
#include <istream>
#include <optional>
#include <string>
#include <cysim/cadence.hpp>
#include <cysim/physics.hpp>
#include <cysim/power.hpp>
#include <cysim/validator.hpp>

namespace cysim {

// Everything a ride needs besides the per-tick input.
struct RideConfig {
  PhysicsParams physics{};
  RiderPrefs rider{};
  Gearset gears{};
  PowerOptions power{};
  RiderCategory category = RiderCategory::Enthusiast;
};

// Stream-based `key,value` loader (test-friendly; no filesystem required).
// Accepts an optional "key,value" header; ignores blank lines and lines
// starting with '#'. Whitespace around fields is trimmed. Unknown keys and
// unparsable values are skipped and leave the default in place.
// Gear lists use ';' between tooth counts, e.g. "cassette,11;12;13".
RideConfig ride_config_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<RideConfig> load_ride_config_csv(const std::string& path);

std::optional<RiderCategory> rider_category_from_string(const std::string& s);

} // namespace cysim
