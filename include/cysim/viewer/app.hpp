#pragma once
#include <cstdint>
#include <deque>
#include <cysim/snap.hpp>

namespace cysim {

class SimRunner;
class DiagnosticLog;

// RAII application that renders the latest snapshots and HUD.
class ViewerApp {
public:
  ViewerApp(SimRunner& sim, const DiagnosticLog* log = nullptr);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  // Rendering
  void render_frame_();
  void draw_gauges_(const SimSnapshot& s);
  void draw_history_(int x, int y, int w, int h);
  void draw_log_(int x, int y, int w, int h);
  void draw_hud_(const SimSnapshot& s);

  // Dependencies
  SimRunner& sim_;
  const DiagnosticLog* log_;

  SimSnapshot last_snap_{};
  std::uint64_t cursor_{0};

  struct HistoryPoint { double t; double power; double speed_kmh; double cadence; };
  std::deque<HistoryPoint> history_;
  double history_window_s_{120.0};

  int manual_cadence_value_{90};
};

} // namespace cysim
