/// @file ui_scale.cpp
/// @brief Computes per-frame panel metrics from the window size.

#include "ui/ui_scale.hpp"

#include <algorithm>
#include <cmath>

namespace framekit {

namespace {

UIScale g_scale;

int scaled_font(float base, float factor) {
    int v = static_cast<int>(std::round(base * factor));
    return std::clamp(v, static_cast<int>(base * 0.7f), static_cast<int>(base * 1.5f));
}

} // namespace

void update_ui_scale(int screen_w, int screen_h) {
    constexpr float BASELINE_H = 720.0f;
    constexpr float BASELINE_W = 1280.0f;

    float sw = static_cast<float>(screen_w);
    float sh = static_cast<float>(screen_h);

    // Height dominates: the panels are a vertical stack
    g_scale.factor = std::clamp((sh / BASELINE_H) * 0.7f + (sw / BASELINE_W) * 0.3f, 0.6f, 1.8f);

    g_scale.panel_w = std::clamp(sw * 0.24f, 240.0f, 380.0f);
    g_scale.margin = std::clamp(10.0f * g_scale.factor, 6.0f, 16.0f);

    // Panels never grow past the 720p layout
    float pf = std::min(g_scale.factor, 1.0f);

    g_scale.font_normal = scaled_font(16.0f, pf);
    g_scale.font_small = scaled_font(14.0f, pf);
    g_scale.font_title = scaled_font(18.0f, pf);

    g_scale.padding = std::round(10.0f * pf);
    g_scale.row_height = std::round(24.0f * pf);
    g_scale.row_gap = std::round(6.0f * pf);
    g_scale.button_height = std::round(30.0f * pf);

    g_scale.hud_font = scaled_font(14.0f, g_scale.factor);
    g_scale.hud_line = std::round(18.0f * g_scale.factor);
}

const UIScale& ui_scale() {
    return g_scale;
}

} // namespace framekit
