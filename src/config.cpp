#include <cysim/config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <fstream>
#include <functional>
#include <unordered_map>
#include <vector>

namespace cysim {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> split(const std::string& line, char sep) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == sep) { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static std::optional<double> to_double(const std::string& s) {
  try {
    size_t idx = 0;
    double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<std::vector<int>> to_teeth(const std::string& s) {
  std::vector<int> out;
  for (const auto& part : split(s, ';')) {
    auto v = to_double(part);
    if (!v || *v < 1.0 || *v != std::floor(*v)) return std::nullopt;
    out.push_back(static_cast<int>(*v));
  }
  if (out.empty()) return std::nullopt;
  return out;
}

std::optional<RiderCategory> rider_category_from_string(const std::string& s) {
  const auto k = lower(trim(s));
  if (k == "recreational") return RiderCategory::Recreational;
  if (k == "enthusiast")   return RiderCategory::Enthusiast;
  if (k == "competitive")  return RiderCategory::Competitive;
  if (k == "elite")        return RiderCategory::Elite;
  if (k == "professional" || k == "pro") return RiderCategory::Professional;
  return std::nullopt;
}

RideConfig ride_config_from_csv_stream(std::istream& in) {
  RideConfig cfg;

  // Scalar keys; a setter returns false to reject the value.
  using Setter = std::function<bool(double)>;
  auto positive = [](double& field) -> Setter {
    return [&field](double v){ if (v <= 0.0) return false; field = v; return true; };
  };
  auto non_negative = [](double& field) -> Setter {
    return [&field](double v){ if (v < 0.0) return false; field = v; return true; };
  };
  auto any = [](double& field) -> Setter {
    return [&field](double v){ field = v; return true; };
  };

  const std::unordered_map<std::string, Setter> scalars{
    {"mass_kg",          positive(cfg.physics.mass_kg)},
    {"crr",              non_negative(cfg.physics.crr)},
    {"cda",              positive(cfg.physics.cda)},
    {"air_density",      positive(cfg.physics.air_density)},
    {"efficiency",       [&](double v){ if (v <= 0.0 || v > 1.0) return false; cfg.physics.efficiency = v; return true; }},
    {"wind_mps",         any(cfg.physics.wind_mps)},
    {"max_speed_mps",    positive(cfg.physics.max_speed_mps)},
    {"ftp",              positive(cfg.rider.ftp)},
    {"low_cadence",      positive(cfg.rider.low_cadence)},
    {"high_cadence",     positive(cfg.rider.high_cadence)},
    {"p50",              positive(cfg.rider.p50)},
    {"k_p",              positive(cfg.rider.k_p)},
    {"max_uphill_drop",  non_negative(cfg.rider.max_uphill_drop)},
    {"grade_scale",      positive(cfg.rider.grade_scale)},
    {"max_down_bump",    non_negative(cfg.rider.max_down_bump)},
    {"wheel_circumference_m", positive(cfg.rider.wheel_circumference_m)},
    {"trainer_tau_s",    positive(cfg.power.trainer_tau_s)},
    {"resting_tau_s",    positive(cfg.power.resting_tau_s)},
    {"low_cadence_rpm",  non_negative(cfg.power.low_cadence_rpm)},
    {"max_power_w",      positive(cfg.power.max_power_w)},
    {"display_window_s", positive(cfg.power.display_window_s)},
  };

  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty() || raw[0] == '#') continue;

    auto cols = split(raw, ',');
    if (cols.size() < 2) continue;
    const std::string key = lower(cols[0]);
    const std::string& value = cols[1];

    if (!header_consumed && key == "key") {
      header_consumed = true;
      continue;
    }

    if (key == "chainrings") {
      if (auto t = to_teeth(value)) cfg.gears.chainrings = *t;
    } else if (key == "cassette") {
      if (auto t = to_teeth(value)) {
        std::sort(t->begin(), t->end());
        cfg.gears.cassette = *t;
      }
    } else if (key == "category") {
      if (auto c = rider_category_from_string(value)) cfg.category = *c;
    } else if (auto it = scalars.find(key); it != scalars.end()) {
      if (auto v = to_double(value); v && std::isfinite(*v)) (void)it->second(*v);
    }
  }
  return cfg;
}

std::optional<RideConfig> load_ride_config_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return ride_config_from_csv_stream(f);
}

} // namespace cysim
