#pragma once
#include <tlsim/snap.hpp>

namespace tlsim {

class Simulation;

// RAII application that renders the road from snapshots and drives the
// simulation from the keyboard.
class ViewerApp {
public:
  explicit ViewerApp(Simulation& sim);
  int run(); // returns 0 on normal exit

private:
  void process_input_();
  void render_frame_(const SimSnapshot& snap);
  void draw_road_(float scale_px_per_m, float road_y);
  void draw_intersections_(const SimSnapshot& snap, float scale_px_per_m, float road_y);
  void draw_cars_(const SimSnapshot& snap, float scale_px_per_m, float road_y);
  void draw_hud_(const SimSnapshot& snap);

  float px_per_m_() const;

  Simulation& sim_;
  float render_scale_{1.0f};
};

} // namespace tlsim
