#pragma once
#include <cstdint>
#include <hamchain/config.hpp>
#include <hamchain/snap.hpp>

namespace hamchain {

class SimRunner;

// RAII application that plots the latest energy trajectories and HUD.
class ViewerApp {
public:
  ViewerApp(SimRunner& sim, Params params);
  int run(); // returns 0 on normal exit

private:
  // Input & data flow
  void process_input_();
  void pump_snapshots_();
  void restart_(const Params& p);
  // Rendering
  void render_frame_();
  void draw_plot_(const RunSnapshot& draw);
  void draw_hud_(const RunSnapshot& draw);
  void draw_dashboard_(const RunSnapshot& draw);

  // Plot area in screen pixels
  struct Rectf { float x; float y; float w; float h; };
  Rectf plot_rect_() const;

  // Dependencies
  SimRunner& sim_;
  Params params_;
  RunSnapshot last_snap_{};
  std::uint64_t cursor_{0};

  // UI state
  bool normalized_{true};   // plot E/E0 instead of E
  int speed_idx_{1};        // index into steps-per-tick cycle
  std::uint32_t next_seed_{1};
};

} // namespace hamchain
