/// @file ui_scale.hpp
/// @brief Responsive panel metrics derived from the current window dimensions.
///
/// Panels read their sizes from here instead of taking extra parameters, so
/// the palette and BOM panels shrink together on small windows.

#pragma once

namespace framekit {

/// Recalculated once per frame from the current window size.
struct UIScale {
    float factor = 1.0f;    ///< screen_h / 720, blended with width
    float panel_w = 300.0f; ///< Right-side panel column width
    float margin = 10.0f;

    int font_normal = 16;
    int font_small = 14;
    int font_title = 18;

    float padding = 10.0f;
    float row_height = 24.0f;
    float row_gap = 6.0f;
    float button_height = 30.0f;

    int hud_font = 14;       ///< Status line font (bottom-left)
    float hud_line = 18.0f;  ///< Status line spacing
};

/// Updates the global UI scale. Call once per frame, before drawing panels.
void update_ui_scale(int screen_w, int screen_h);

const UIScale& ui_scale();

} // namespace framekit
