#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

#include <cysim/viewer/app.hpp>
#include <cysim/diagnostics.hpp>
#include <cysim/physics.hpp>
#include <cysim/sim_runner.hpp>
#include <cysim/validator.hpp>

namespace cysim {

namespace {

const Color kPanel     = Color{24, 24, 28, 220};
const Color kShadow    = Color{0, 0, 0, 80};
const Color kText      = Color{220, 220, 230, 255};
const Color kDim       = Color{150, 150, 165, 255};
const Color kPowerCol  = Color{241, 196, 15, 255};   // yellow
const Color kSpeedCol  = Color{52, 152, 219, 255};   // blue
const Color kCadCol    = Color{46, 204, 113, 255};   // green
const Color kWarnCol   = Color{231, 76, 60, 255};    // red

static void panel(int x, int y, int w, int h) {
  DrawRectangle(x - 6, y - 6, w + 12, h + 12, kShadow);
  DrawRectangle(x, y, w, h, kPanel);
}

static Color severityColor(Severity s) {
  switch (s) {
    case Severity::Critical: return Color{255, 80, 80, 255};
    case Severity::Error:    return kWarnCol;
    case Severity::Warning:  return Color{230, 126, 34, 255};
    case Severity::Info:     return kDim;
  }
  return kDim;
}

// Outside the recommended band the value is highlighted.
static Color rangeColor(double v, ParamKind kind, Color normal) {
  const SafetyLimits l = ValueValidator::safety_limits(kind);
  if (v < l.recommended_min || v > l.recommended_max) return Color{230, 126, 34, 255};
  return normal;
}

// Big number with a caption underneath.
static void gauge(int x, int y, const char* value, const char* caption, Color c) {
  DrawText(value, x, y, 40, c);
  DrawText(caption, x, y + 44, 16, kDim);
}

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y = 20;
static constexpr int kHUD_LINE2_Y = 46;
static constexpr int kHUD_BOTTOM  = 80;

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SimRunner& sim, const DiagnosticLog* log) : sim_(sim), log_(log) {}

int ViewerApp::run() {
  const int W = 1024, H = 768;
  InitWindow(W, H, "cysim - Rider Telemetry");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  // Power
  const int step = (IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT)) ? 50 : 10;
  if (IsKeyPressed(KEY_UP))   sim_.target_power.store(std::min(2000, sim_.target_power.load() + step));
  if (IsKeyPressed(KEY_DOWN)) sim_.target_power.store(std::max(0, sim_.target_power.load() - step));

  // Grade
  if (IsKeyPressed(KEY_RIGHT)) sim_.grade_percent.store(std::min(30.0, sim_.grade_percent.load() + 0.5));
  if (IsKeyPressed(KEY_LEFT))  sim_.grade_percent.store(std::max(-30.0, sim_.grade_percent.load() - 0.5));
  if (IsKeyPressed(KEY_ZERO))  sim_.grade_percent.store(0.0);

  // Randomness
  if (IsKeyPressed(KEY_RIGHT_BRACKET)) sim_.randomness.store(std::min(100, sim_.randomness.load() + 5));
  if (IsKeyPressed(KEY_LEFT_BRACKET))  sim_.randomness.store(std::max(0, sim_.randomness.load() - 5));

  // Cadence mode: M toggles manual, +/- adjust
  if (IsKeyPressed(KEY_M)) {
    sim_.manual_cadence.store(sim_.manual_cadence.load() < 0 ? manual_cadence_value_ : -1);
  }
  if (IsKeyPressed(KEY_EQUAL) || IsKeyPressed(KEY_KP_ADD)) {
    manual_cadence_value_ = std::min(180, manual_cadence_value_ + 5);
    if (sim_.manual_cadence.load() >= 0) sim_.manual_cadence.store(manual_cadence_value_);
  }
  if (IsKeyPressed(KEY_MINUS) || IsKeyPressed(KEY_KP_SUBTRACT)) {
    manual_cadence_value_ = std::max(0, manual_cadence_value_ - 5);
    if (sim_.manual_cadence.load() >= 0) sim_.manual_cadence.store(manual_cadence_value_);
  }

  if (IsKeyPressed(KEY_SPACE)) sim_.resting.store(!sim_.resting.load());

  // Reset: R keeps the rider state, F clears it
  if (IsKeyPressed(KEY_R)) sim_.request_reset(ResetMode::TimeCursorOnly);
  if (IsKeyPressed(KEY_F)) {
    sim_.request_reset(ResetMode::Full);
    history_.clear();
  }
}

void ViewerApp::pump_snapshots_() {
  auto& buf = sim_.buffer();
  if (buf.try_consume_latest(cursor_, last_snap_)) {
    if (!history_.empty() && last_snap_.sim_time < history_.back().t) history_.clear();
    history_.push_back({last_snap_.sim_time,
                        double(last_snap_.state.power_watts),
                        last_snap_.state.speed_mps * kMsToKmh,
                        double(last_snap_.state.cadence_rpm)});
    const double cutoff = last_snap_.sim_time - history_window_s_;
    while (!history_.empty() && history_.front().t < cutoff) history_.pop_front();
  }
}

void ViewerApp::render_frame_() {
  const SimSnapshot s = last_snap_;

  BeginDrawing();
  ClearBackground(Color{18, 20, 24, 255});

  draw_hud_(s);
  draw_gauges_(s);

  const int W = GetScreenWidth();
  const int H = GetScreenHeight();
  draw_history_(20, 330, W - 40, 220);
  draw_log_(20, 580, W - 40, H - 600);
  EndDrawing();
}

void ViewerApp::draw_gauges_(const SimSnapshot& s) {
  const int x0 = 20, y0 = kHUD_BOTTOM + 10;
  const int w = GetScreenWidth() - 40, h = 220;
  panel(x0, y0, w, h);

  const auto& st = s.state;
  gauge(x0 + 20,  y0 + 16, TextFormat("%d W", st.power_watts), TextFormat("power (3s avg %.0f W)", s.display_power), kPowerCol);
  gauge(x0 + 290, y0 + 16, TextFormat("%.1f km/h", st.speed_mps * kMsToKmh), "speed", kSpeedCol);
  gauge(x0 + 560, y0 + 16, TextFormat("%d rpm", st.cadence_rpm),
        s.manual_cadence >= 0 ? "cadence (manual)" : "cadence (auto)",
        rangeColor(double(st.cadence_rpm), ParamKind::Cadence, kCadCol));
  gauge(x0 + 800, y0 + 16, TextFormat("%dx%d", st.gear.front, st.gear.rear), "gear", kText);

  const int y1 = y0 + 110;
  DrawText(TextFormat("target cadence %.0f rpm", st.target_cadence), x0 + 20, y1, 18, kText);
  DrawText(TextFormat("noise %+.2f rpm", st.noise), x0 + 290, y1, 18, kText);
  DrawText(TextFormat("grade %+.1f %%", s.grade_percent), x0 + 560, y1, 18,
           rangeColor(s.grade_percent, ParamKind::Gradient, kText));
  DrawText(TextFormat("randomness %d", s.randomness), x0 + 800, y1, 18,
           rangeColor(double(s.randomness), ParamKind::Randomness, kText));

  // Fatigue bar
  const int by = y1 + 40;
  const int bw = w - 40;
  DrawText("fatigue", x0 + 20, by, 16, kDim);
  DrawRectangle(x0 + 100, by, bw - 80, 16, Color{40, 40, 46, 255});
  const float f = float(std::clamp(st.fatigue, 0.0, 1.0));
  DrawRectangle(x0 + 100, by, int((bw - 80) * f), 16, f > 0.5f ? kWarnCol : Color{230, 126, 34, 255});
  DrawText(TextFormat("%.3f", st.fatigue), x0 + 100 + bw - 70, by, 16, kText);

  if (s.resting) DrawText("RESTING", x0 + 20, by + 28, 18, kWarnCol);
}

void ViewerApp::draw_history_(int x, int y, int w, int h) {
  panel(x, y, w, h);
  DrawText("last 2 min", x + 8, y + 6, 14, kDim);
  if (history_.size() < 2) return;

  double p_max = 100.0, v_max = 20.0, c_max = 120.0;
  for (const auto& p : history_) {
    p_max = std::max(p_max, p.power);
    v_max = std::max(v_max, p.speed_kmh);
  }
  const double t1 = history_.back().t;
  const double t0 = t1 - history_window_s_;

  auto px = [&](double t) { return float(x + (t - t0) / history_window_s_ * w); };
  auto py = [&](double v, double vmax) { return float(y + h - 4 - (v / vmax) * (h - 28)); };

  for (std::size_t i = 1; i < history_.size(); ++i) {
    const auto& a = history_[i - 1];
    const auto& b = history_[i];
    DrawLineEx({px(a.t), py(a.power, p_max)}, {px(b.t), py(b.power, p_max)}, 2.0f, kPowerCol);
    DrawLineEx({px(a.t), py(a.speed_kmh, v_max)}, {px(b.t), py(b.speed_kmh, v_max)}, 2.0f, kSpeedCol);
    DrawLineEx({px(a.t), py(a.cadence, c_max)}, {px(b.t), py(b.cadence, c_max)}, 1.0f, kCadCol);
  }
  DrawText(TextFormat("%.0f W", p_max), x + w - 180, y + 6, 14, kPowerCol);
  DrawText(TextFormat("%.0f km/h", v_max), x + w - 110, y + 6, 14, kSpeedCol);
}

void ViewerApp::draw_log_(int x, int y, int w, int h) {
  if (h < 30) return;
  panel(x, y, w, h);
  DrawText("diagnostics", x + 8, y + 6, 14, kDim);
  if (!log_) return;

  const auto entries = log_->entries();
  const int line_h = 16;
  const int rows = std::max(0, (h - 28) / line_h);
  const std::size_t first = entries.size() > std::size_t(rows) ? entries.size() - rows : 0;
  int ly = y + 26;
  for (std::size_t i = first; i < entries.size(); ++i) {
    const std::string line = format_entry(entries[i]);
    DrawText(line.c_str(), x + 8, ly, 14, severityColor(entries[i].severity));
    ly += line_h;
  }
}

void ViewerApp::draw_hud_(const SimSnapshot& s) {
  DrawText(TextFormat("target=%d W  grade=%+.1f%%  rand=%d  tick=%llu  sim=%.1fs",
                      s.target_power, s.grade_percent, s.randomness,
                      (unsigned long long)s.tick, s.sim_time),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});

  DrawText("Up/Down: Power (Shift x5) | Left/Right: Grade | 0: Flat | [ ]: Randomness | M: Manual cadence | +/-: Cadence | Space: Rest | R/F: Reset",
           20, kHUD_LINE2_Y, 14, Color{190, 205, 190, 255});
}

} // namespace cysim
