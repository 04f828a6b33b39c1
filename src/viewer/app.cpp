#include <raylib.h>
#include <algorithm>
#include <string>
#include <unordered_map>

#include <tlsim/viewer/app.hpp>
#include <tlsim/simulation.hpp>

namespace tlsim {

namespace {

static constexpr int kMarginPx = 40;
static constexpr float kRoadHalfWidthPx = 20.0f;
static constexpr double kSpawnSpeedMps = 12.0;

// High-contrast palette; assigned per CarId (stable during session).
static Color colorFor(CarId id) {
  static const Color PAL[] = {
    {52, 152, 219, 255},  // blue
    {241, 196, 15, 255},  // yellow
    {155, 89, 182, 255},  // purple
    {26, 188, 156, 255},  // teal
    {230, 126, 34, 255},  // orange
    {236, 112, 99, 255},  // salmon
    {127, 140, 141, 255}, // gray
    {33, 97, 140, 255},   // steel blue
  };
  static std::unordered_map<CarId, int> idx;
  auto it = idx.find(id);
  if (it == idx.end()) {
    int assigned = static_cast<int>(idx.size()) % static_cast<int>(sizeof(PAL)/sizeof(PAL[0]));
    it = idx.emplace(id, assigned).first;
  }
  return PAL[it->second];
}

static Color lampColor(LightColor c) {
  switch (c) {
    case LightColor::Green:  return Color{46, 204, 113, 255};
    case LightColor::Yellow: return Color{241, 196, 15, 255};
    case LightColor::Red:    return Color{231, 76, 60, 255};
  }
  return Color{90, 90, 90, 255};
}

} // namespace

// ---- ViewerApp ----

ViewerApp::ViewerApp(Simulation& sim)
  : sim_(sim), render_scale_(static_cast<float>(sim.config().render_scale)) {}

float ViewerApp::px_per_m_() const {
  const double road = sim_.runner().road_length();
  const float usable = float(GetScreenWidth() - 2 * kMarginPx);
  return road > 0.0 ? usable / float(road) * render_scale_ : 1.0f;
}

int ViewerApp::run() {
  const int W = 1000, H = 700;
  InitWindow(W, H, "tlsim - Traffic Viewer");
  SetTargetFPS(60);

  while (!WindowShouldClose()) {
    process_input_();
    render_frame_(sim_.snapshot());
  }

  CloseWindow();
  return 0;
}

void ViewerApp::process_input_() {
  if (IsKeyPressed(KEY_ENTER)) sim_.start();
  if (IsKeyPressed(KEY_P))     sim_.pause();
  if (IsKeyPressed(KEY_C))     sim_.resume();
  if (IsKeyPressed(KEY_X))     sim_.stop();

  if (IsKeyPressed(KEY_L)) {
    if (sim_.lights().is_running()) sim_.stop_lights();
    else sim_.start_lights();
  }
  if (IsKeyPressed(KEY_D)) sim_.load_scenario(demo_scenario(sim_.config().seed));

  // A: car at the road start; I: intersection under the mouse cursor.
  if (IsKeyPressed(KEY_A)) sim_.spawn_car(0.0, kSpawnSpeedMps);
  if (IsKeyPressed(KEY_I)) {
    const double x_m = double(GetMouseX() - kMarginPx) / double(px_per_m_());
    if (x_m >= 0.0 && x_m <= sim_.runner().road_length()) sim_.spawn_intersection(x_m);
  }

  if (IsKeyPressed(KEY_EQUAL) || IsKeyPressed(KEY_KP_ADD))
    render_scale_ = std::min(2.0f, render_scale_ + 0.1f);
  if (IsKeyPressed(KEY_MINUS) || IsKeyPressed(KEY_KP_SUBTRACT))
    render_scale_ = std::max(0.5f, render_scale_ - 0.1f);
}

void ViewerApp::render_frame_(const SimSnapshot& snap) {
  const float scale = px_per_m_();
  const float road_y = GetScreenHeight() * 0.55f;

  BeginDrawing();
  ClearBackground(Color{30, 60, 30, 255});

  draw_road_(scale, road_y);
  draw_intersections_(snap, scale, road_y);
  draw_cars_(snap, scale, road_y);
  draw_hud_(snap);
  EndDrawing();
}

void ViewerApp::draw_road_(float scale, float road_y) {
  const float x0 = float(kMarginPx);
  const float len_px = float(sim_.runner().road_length()) * scale;

  DrawRectangleRec(Rectangle{x0, road_y - kRoadHalfWidthPx, len_px, 2.0f * kRoadHalfWidthPx},
                   Color{40, 40, 46, 255});
  DrawLineEx({x0, road_y - kRoadHalfWidthPx}, {x0 + len_px, road_y - kRoadHalfWidthPx}, 2.0f,
             Color{80, 80, 80, 255});
  DrawLineEx({x0, road_y + kRoadHalfWidthPx}, {x0 + len_px, road_y + kRoadHalfWidthPx}, 2.0f,
             Color{80, 80, 80, 255});

  // Ruler every 100 m
  const float ruler_y = road_y + kRoadHalfWidthPx + 30.0f;
  for (int m = 0; m <= int(sim_.runner().road_length()); m += 100) {
    const float px = x0 + float(m) * scale;
    DrawLine(int(px), int(ruler_y - 6), int(px), int(ruler_y + 6), Color{200, 200, 200, 255});
    DrawText(TextFormat("%dm", m), int(px) - 12, int(ruler_y + 10), 12, Color{200, 200, 200, 255});
  }
}

void ViewerApp::draw_intersections_(const SimSnapshot& snap, float scale, float road_y) {
  for (const auto& in : snap.intersections) {
    const float px = float(kMarginPx) + float(in.x) * scale;
    DrawLineEx({px, road_y - kRoadHalfWidthPx}, {px, road_y + kRoadHalfWidthPx}, 3.0f,
               Color{235, 235, 235, 255});
    // Stop line
    const float stop_px = px - float(kStoppingMarginM) * scale;
    DrawLineEx({stop_px, road_y - kRoadHalfWidthPx}, {stop_px, road_y + kRoadHalfWidthPx}, 1.0f,
               Color{200, 70, 70, 160});
    // Lamp above the road
    const float lamp_y = road_y - kRoadHalfWidthPx - 24.0f;
    DrawRectangle(int(px) - 10, int(lamp_y) - 10, 20, 20, Color{20, 20, 22, 255});
    DrawCircleV({px, lamp_y}, 7.0f, lampColor(in.color));
    DrawText(TextFormat("I%d", in.id), int(px) - 8, int(lamp_y) - 30, 14, Color{220, 220, 230, 255});
  }
}

void ViewerApp::draw_cars_(const SimSnapshot& snap, float scale, float road_y) {
  const float len_px = 16.0f, wid_px = 10.0f;
  for (const auto& car : snap.cars) {
    const float px = float(kMarginPx) + float(car.x) * scale;
    const float py = road_y - float(car.y) * scale;
    DrawRectangleRec(Rectangle{px - len_px * 0.5f, py - wid_px * 0.5f, len_px, wid_px},
                     colorFor(car.id));
    DrawText(TextFormat("%d", car.id), int(px) - 4, int(py + wid_px), 12, colorFor(car.id));
  }
}

void ViewerApp::draw_hud_(const SimSnapshot& snap) {
  const auto& lights = sim_.lights();
  const char* light_state = !lights.is_running() ? "off" : (lights.is_paused() ? "paused" : "cycling");

  DrawText(TextFormat("%s  tick=%llu  sim=%.2fs  cars=%d  intersections=%d  lights=%s",
                      run_state_name(snap.state),
                      (unsigned long long)snap.tick,
                      snap.sim_time,
                      (int)snap.cars.size(),
                      (int)snap.intersections.size(),
                      light_state),
           20, 20, 20, Color{220, 235, 220, 255});

  const std::string clock = sim_.current_time();
  DrawText(clock.c_str(), GetScreenWidth() - 120, 20, 20, Color{235, 235, 200, 255});

  DrawText(TextFormat("scale=%.1fx  pause lights on pause=%s", render_scale_,
                      sim_.config().pause_lights_on_pause ? "yes" : "no"),
           20, 46, 16, Color{200, 210, 200, 255});

  DrawText("Enter: Start | P: Pause | C: Continue | X: Stop | L: Lights on/off | D: Demo | A: Add car | I: Add light | +/-: Scale",
           20, 72, 14, Color{190, 205, 190, 255});
}

} // namespace tlsim
