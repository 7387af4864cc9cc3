#include <raylib.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

#include <hamchain/viewer/app.hpp>
#include <hamchain/sim_runner.hpp>
#include <hamchain/snap_buffer.hpp>
#include <hamchain/diagnostics.hpp>
#include <hamchain/error.hpp>

namespace hamchain {

namespace {

// One color per scheme, indexed by Scheme.
static Color colorFor(Scheme s) {
  static const Color PAL[] = {
    { 46, 204, 113, 255},  // Verlet: green
    {231,  76,  60, 255},  // Forward Euler: red
    { 52, 152, 219, 255},  // Backward Euler: blue
  };
  return PAL[static_cast<int>(s) % 3];
}

static const int kSpeedCycle[] = {0, 1, 2, 4, 8, 16, 64};
static constexpr int kSpeedCount = static_cast<int>(sizeof(kSpeedCycle) / sizeof(kSpeedCycle[0]));

static const int kSizeCycle[] = {8, 32, 128, 512};
static constexpr int kSizeCount = static_cast<int>(sizeof(kSizeCycle) / sizeof(kSizeCycle[0]));

// --- HUD layout (keep in sync with draw_hud_) ---
static constexpr int kHUD_LINE1_Y    = 20;  // size 20
static constexpr int kHUD_LINE2_Y    = 46;  // size 14
static constexpr int kHUD_BOTTOM_PAD = 24;

// Value plotted for step k: raw energy or energy relative to the first sample.
static double plot_value(const Trajectory& t, std::size_t k, bool normalized) {
  if (!normalized) return t[k];
  const double e0 = t.front();
  return std::fabs(e0) < kDegenerateMeanEps ? t[k] : t[k] / e0;
}

static void fmt_metric(const Trajectory& t, double (*metric)(const Trajectory&),
                       char* out, int cap) {
  if (cap <= 0 || out == nullptr) return;
  try {
    std::snprintf(out, (size_t)cap, "%.3e", metric(t));
  } catch (const Error&) {
    // empty or zero-energy trajectory: metric undefined
    std::snprintf(out, (size_t)cap, "%s", "--");
  }
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(SimRunner& sim, Params params)
  : sim_(sim), params_(params),
    next_seed_(params.seed.has_value() ? *params.seed + 1u : 1u) {
  speed_idx_ = 2; // 2 steps per tick
  sim_.steps_per_tick.store(kSpeedCycle[speed_idx_]);
}

ViewerApp::Rectf ViewerApp::plot_rect_() const {
  const float top = float(kHUD_LINE2_Y + 14 + kHUD_BOTTOM_PAD);
  const float left = 90.0f;
  const float right_pad = 30.0f;
  const float bottom_pad = 150.0f; // room for the dashboard
  return { left, top,
           float(GetScreenWidth()) - left - right_pad,
           float(GetScreenHeight()) - top - bottom_pad };
}

int ViewerApp::run() {
  const int W = 1280, H = 800;
  InitWindow(W, H, "hamchain - energy viewer");
  SetTargetFPS(60);
  TraceLog(LOG_INFO, "hamchain: n=%d dt=%g steps=%zu", params_.n, params_.dt, num_steps(params_));

  while (!WindowShouldClose()) {
    process_input_();
    pump_snapshots_();
    render_frame_();
  }

  CloseWindow();
  return 0;
}

void ViewerApp::restart_(const Params& p) {
  try {
    sim_.request_restart(p);
    params_ = p;
    TraceLog(LOG_INFO, "hamchain: restart n=%d dt=%g steps=%zu seed=%u",
             p.n, p.dt, num_steps(p), p.seed.has_value() ? *p.seed : 0u);
  } catch (const Error& e) {
    TraceLog(LOG_WARNING, "hamchain: restart rejected: %s", e.what());
  }
}

void ViewerApp::process_input_() {
  // Speed / pause
  if (IsKeyPressed(KEY_SPACE)) {
    const int cur = sim_.steps_per_tick.load();
    sim_.steps_per_tick.store(cur == 0 ? kSpeedCycle[std::max(1, speed_idx_)] : 0);
  }
  if (IsKeyPressed(KEY_RIGHT) && speed_idx_ + 1 < kSpeedCount) {
    sim_.steps_per_tick.store(kSpeedCycle[++speed_idx_]);
  }
  if (IsKeyPressed(KEY_LEFT) && speed_idx_ > 0) {
    sim_.steps_per_tick.store(kSpeedCycle[--speed_idx_]);
  }

  if (IsKeyPressed(KEY_E)) normalized_ = !normalized_;

  // Same parameters, fresh noise
  if (IsKeyPressed(KEY_R)) {
    Params p = params_;
    p.seed = next_seed_++;
    restart_(p);
  }

  // Halve / double dt; the step count follows so the horizon stays 2*pi
  if (IsKeyPressed(KEY_LEFT_BRACKET) || IsKeyPressed(KEY_RIGHT_BRACKET)) {
    Params p = params_;
    p.dt = IsKeyPressed(KEY_LEFT_BRACKET) ? p.dt * 0.5 : p.dt * 2.0;
    p.steps.reset();
    restart_(p);
  }

  // Cycle system size
  if (IsKeyPressed(KEY_N)) {
    int idx = 0;
    while (idx < kSizeCount && kSizeCycle[idx] <= params_.n) ++idx;
    Params p = params_;
    p.n = kSizeCycle[idx % kSizeCount];
    restart_(p);
  }
}

void ViewerApp::pump_snapshots_() {
  auto& buf = sim_.buffer();
  (void)buf.try_consume_latest(cursor_, last_snap_);
}

void ViewerApp::render_frame_() {
  const RunSnapshot& draw = last_snap_;

  BeginDrawing();
  ClearBackground(Color{18, 18, 22, 255});

  draw_plot_(draw);
  draw_dashboard_(draw);
  draw_hud_(draw);
  EndDrawing();
}

void ViewerApp::draw_plot_(const RunSnapshot& draw) {
  const Rectf r = plot_rect_();
  DrawRectangle(int(r.x), int(r.y), int(r.w), int(r.h), Color{24, 24, 28, 255});
  DrawRectangleLines(int(r.x), int(r.y), int(r.w), int(r.h), Color{60, 60, 70, 255});

  if (draw.num_steps == 0 || draw.step == 0) {
    DrawText("waiting for data...", int(r.x + 12), int(r.y + 12), 18, Color{160, 160, 170, 255});
    return;
  }

  // Shared y-range over every scheme
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (Scheme s : kAllSchemes) {
    const Trajectory& t = draw.of(s);
    for (std::size_t k = 0; k < t.size(); ++k) {
      const double v = plot_value(t, k, normalized_);
      if (!std::isfinite(v)) continue;
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  if (!(hi >= lo)) return;
  if (hi - lo < 1e-12) { hi += 0.5e-3; lo -= 0.5e-3; }
  const double pad = 0.05 * (hi - lo);
  lo -= pad; hi += pad;

  auto to_screen = [&](double k, double v) {
    const float x = r.x + float(k / double(draw.num_steps)) * r.w;
    const float y = r.y + r.h - float((v - lo) / (hi - lo)) * r.h;
    return Vector2{x, y};
  };

  // Axis labels (min/mid/max)
  const Color axis = Color{170, 170, 180, 255};
  DrawText(TextFormat("%.5g", hi), 10, int(r.y), 14, axis);
  DrawText(TextFormat("%.5g", 0.5 * (lo + hi)), 10, int(r.y + r.h * 0.5f - 7), 14, axis);
  DrawText(TextFormat("%.5g", lo), 10, int(r.y + r.h - 14), 14, axis);
  DrawText("0", int(r.x), int(r.y + r.h + 4), 14, axis);
  DrawText(TextFormat("%zu", draw.num_steps), int(r.x + r.w - 40), int(r.y + r.h + 4), 14, axis);
  DrawText(normalized_ ? "E / E0" : "E", int(r.x + 8), int(r.y + 6), 16, axis);

  // One polyline per scheme, decimated to about one vertex per pixel
  const std::size_t stride = std::max<std::size_t>(1, draw.num_steps / std::max<std::size_t>(1, std::size_t(r.w)));
  for (Scheme s : kAllSchemes) {
    const Trajectory& t = draw.of(s);
    if (t.size() < 2) continue;
    Vector2 prev = to_screen(0.0, plot_value(t, 0, normalized_));
    for (std::size_t k = stride; k < t.size(); k += stride) {
      const Vector2 cur = to_screen(double(k), plot_value(t, k, normalized_));
      DrawLineEx(prev, cur, 2.0f, colorFor(s));
      prev = cur;
    }
  }
}

void ViewerApp::draw_dashboard_(const RunSnapshot& draw) {
  const int row_h = 20;
  const int pad   = 8;
  const int x0    = 20;
  const int y0    = GetScreenHeight() - 120;
  const int box_w = 560;
  const int box_h = pad * 2 + row_h * (int(kAllSchemes.size()) + 1);

  DrawRectangle(x0, y0, box_w, box_h, Color{24, 24, 28, 220});
  DrawLine(x0, y0 + pad + row_h, x0 + box_w, y0 + pad + row_h, Color{60, 60, 70, 255});

  const int X_NAME = x0 + pad;
  const int X_LAST = x0 + pad + 190;
  const int X_ERR  = x0 + pad + 310;
  const int X_DRIFT= x0 + pad + 430;

  const Color hdr = Color{220, 220, 230, 255};
  DrawText("Scheme",   X_NAME,  y0 + pad - 2, 16, hdr);
  DrawText("E last",   X_LAST,  y0 + pad - 2, 16, hdr);
  DrawText("Cons err", X_ERR,   y0 + pad - 2, 16, hdr);
  DrawText("Drift",    X_DRIFT, y0 + pad - 2, 16, hdr);

  int y = y0 + pad + row_h + 2;
  char buf_err[32], buf_drift[32];
  for (Scheme s : kAllSchemes) {
    const Trajectory& t = draw.of(s);
    fmt_metric(t, &conservation_error, buf_err, sizeof(buf_err));
    fmt_metric(t, &relative_drift, buf_drift, sizeof(buf_drift));

    DrawRectangle(X_NAME, y + 3, 10, 10, colorFor(s));
    DrawText(scheme_name(s), X_NAME + 16, y, 16, colorFor(s));
    DrawText(t.empty() ? "--" : TextFormat("%.5g", t.back()), X_LAST, y, 16, hdr);
    DrawText(buf_err,   X_ERR,   y, 16, hdr);
    DrawText(buf_drift, X_DRIFT, y, 16, hdr);
    y += row_h;
  }
}

void ViewerApp::draw_hud_(const RunSnapshot& draw) {
  const int per_tick = sim_.steps_per_tick.load();
  const char* status = !draw.error.empty() ? "FAILED"
                     : draw.finished       ? "finished"
                     : per_tick == 0       ? "paused"
                                           : "running";

  DrawText(TextFormat("n=%d  dt=%g  step=%zu/%zu  steps/tick=%d  %s",
                      draw.n, draw.dt, draw.step, draw.num_steps, per_tick, status),
           20, kHUD_LINE1_Y, 20, Color{220, 235, 220, 255});

  if (!draw.error.empty()) {
    DrawText(draw.error.c_str(), 20, kHUD_LINE2_Y, 14, Color{235, 120, 110, 255});
  } else {
    DrawText("Space: Pause/Resume | Left/Right: Speed | [ ]: dt x0.5/x2 | N: Size | R: New seed | E: E vs E/E0",
             20, kHUD_LINE2_Y, 14, Color{190, 205, 190, 255});
  }
}

} // namespace hamchain
