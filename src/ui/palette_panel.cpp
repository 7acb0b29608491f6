/// @file palette_panel.cpp
/// @brief Implements the palette panel with custom-drawn Raylib controls

#include "ui/palette_panel.hpp"

#include "geometry/grid_transform.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace framekit {

namespace {

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color TAB_ACTIVE = {60, 110, 180, 255};
const Color TOGGLE_ON = {40, 160, 70, 255};
const Color TOGGLE_OFF = {70, 70, 85, 255};

constexpr float BUTTON_GAP = 4.0f;

const char* tab_label(PartCategory category) {
    switch (category) {
    case PartCategory::SUPPORT:
        return "Support";
    case PartCategory::CONNECTOR:
        return "Conn.";
    case PartCategory::LOCKPIN:
        return "Pin";
    case PartCategory::CUSTOM:
        return "Custom";
    }
    return "?";
}

/// Draw a button. Returns true if clicked this frame.
bool draw_button(const char* text, float x, float y, float w, float h, Color bg) {
    const UIScale& s = ui_scale();
    Rectangle rect = {x, y, w, h};
    bool hovered = CheckCollisionPointRec(GetMousePosition(), rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    Color fill = bg;
    if (hovered) {
        fill.r = static_cast<unsigned char>(std::min(255, fill.r + 20));
        fill.g = static_cast<unsigned char>(std::min(255, fill.g + 20));
        fill.b = static_cast<unsigned char>(std::min(255, fill.b + 20));
    }
    DrawRectangleRec(rect, fill);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureText(text, s.font_small);
    DrawText(text, static_cast<int>(x + (w - static_cast<float>(tw)) / 2.0f),
             static_cast<int>(y + (h - static_cast<float>(s.font_small)) / 2.0f), s.font_small,
             TEXT_COLOR);
    return clicked;
}

/// Equal-width buttons across one row. Returns the clicked index or -1.
int draw_button_row(const std::vector<std::string>& labels, int highlighted, float x, float y,
                    float w, float h) {
    int count = static_cast<int>(labels.size());
    float bw = (w - static_cast<float>(count - 1) * BUTTON_GAP) / static_cast<float>(count);
    int clicked = -1;
    for (int i = 0; i < count; i++) {
        float bx = x + static_cast<float>(i) * (bw + BUTTON_GAP);
        Color bg = i == highlighted ? TAB_ACTIVE : BUTTON_BG;
        if (draw_button(labels[static_cast<size_t>(i)].c_str(), bx, y, bw, h, bg)) {
            clicked = i;
        }
    }
    return clicked;
}

std::string rotation_label(char axis, int degrees) {
    return std::string(1, axis) + ": " + std::to_string(degrees);
}

int next_quarter_turn(int degrees) {
    return (degrees + 90) % 360;
}

} // namespace

const PartDefinition* selected_definition(const Catalog& catalog, const UIState& state) {
    auto defs = catalog.definitions_in(PALETTE_TABS[static_cast<size_t>(state.tab)]);
    if (defs.empty()) {
        return nullptr;
    }
    int index = std::clamp(state.picked[static_cast<size_t>(state.tab)], 0,
                           static_cast<int>(defs.size()) - 1);
    return defs[static_cast<size_t>(index)];
}

PalettePanelResult draw_palette_panel(UIState& state, const Catalog& catalog, float panel_x,
                                      float panel_y, float panel_w) {
    const UIScale& s = ui_scale();
    PalettePanelResult result;
    PaletteAction& action = result.action;

    // Title, tabs, picker, description, rotation, orientation, two toggles, file row
    float step = s.button_height + s.row_gap;
    result.panel_height = 2.0f * s.padding + s.row_height + 7.0f * step + s.button_height;

    float content_w = panel_w - 2.0f * s.padding;
    float cx = panel_x + s.padding;
    float cy = panel_y + s.padding;

    DrawRectangleRec({panel_x, panel_y, panel_w, result.panel_height}, BG_COLOR);
    DrawRectangleLinesEx({panel_x, panel_y, panel_w, result.panel_height}, 1.0f, BORDER_COLOR);

    DrawText("PARTS", static_cast<int>(cx), static_cast<int>(cy), s.font_title, TEXT_COLOR);
    cy += s.row_height;

    // Category tabs
    std::vector<std::string> tabs;
    for (PartCategory category : PALETTE_TABS) {
        tabs.emplace_back(tab_label(category));
    }
    int tab = draw_button_row(tabs, state.tab, cx, cy, content_w, s.button_height);
    if (tab >= 0 && tab != state.tab) {
        state.tab = tab;
        action.selection_changed = true;
    }
    cy += step;

    // Part picker: < name >
    auto defs = catalog.definitions_in(PALETTE_TABS[static_cast<size_t>(state.tab)]);
    int& picked = state.picked[static_cast<size_t>(state.tab)];
    float arrow_w = s.button_height;
    if (draw_button("<", cx, cy, arrow_w, s.button_height, BUTTON_BG) && !defs.empty()) {
        picked = (picked + static_cast<int>(defs.size()) - 1) % static_cast<int>(defs.size());
        action.selection_changed = true;
    }
    if (draw_button(">", cx + content_w - arrow_w, cy, arrow_w, s.button_height, BUTTON_BG) &&
        !defs.empty()) {
        picked = (picked + 1) % static_cast<int>(defs.size());
        action.selection_changed = true;
    }
    const PartDefinition* current = selected_definition(catalog, state);
    const char* name = current != nullptr ? current->name.c_str() : "(none)";
    int name_w = MeasureText(name, s.font_normal);
    DrawText(name, static_cast<int>(cx + (content_w - static_cast<float>(name_w)) / 2.0f),
             static_cast<int>(cy + (s.button_height - static_cast<float>(s.font_normal)) / 2.0f),
             s.font_normal, TEXT_COLOR);
    cy += step;

    if (current != nullptr) {
        DrawText(current->id.c_str(), static_cast<int>(cx), static_cast<int>(cy), s.font_small,
                 LABEL_COLOR);
    }
    cy += step;

    // Rotation: one button per axis, each click adds a quarter turn
    std::vector<std::string> rot_labels = {rotation_label('X', state.rotation.x),
                                           rotation_label('Y', state.rotation.y),
                                           rotation_label('Z', state.rotation.z)};
    switch (draw_button_row(rot_labels, -1, cx, cy, content_w, s.button_height)) {
    case 0:
        state.rotation.x = next_quarter_turn(state.rotation.x);
        break;
    case 1:
        state.rotation.y = next_quarter_turn(state.rotation.y);
        break;
    case 2:
        state.rotation.z = next_quarter_turn(state.rotation.z);
        break;
    default:
        break;
    }
    cy += step;

    std::string orient_label = "Orientation: " + std::string(axis_name(state.orientation));
    if (draw_button(orient_label.c_str(), cx, cy, content_w, s.button_height, BUTTON_BG)) {
        state.orientation = next_orientation(state.orientation);
    }
    cy += step;

    if (draw_button(state.snap_enabled ? "Snap: ON" : "Snap: OFF", cx, cy, content_w,
                    s.button_height, state.snap_enabled ? TOGGLE_ON : TOGGLE_OFF)) {
        state.snap_enabled = !state.snap_enabled;
        action.snap_toggled = true;
    }
    cy += step;

    if (draw_button(state.custom_skip_collision ? "Custom parts overlap: ON"
                                                : "Custom parts overlap: OFF",
                    cx, cy, content_w, s.button_height,
                    state.custom_skip_collision ? TOGGLE_ON : TOGGLE_OFF)) {
        state.custom_skip_collision = !state.custom_skip_collision;
        action.collision_toggled = true;
    }
    cy += step;

    switch (draw_button_row({"Save", "Load", "Clear"}, -1, cx, cy, content_w, s.button_height)) {
    case 0:
        action.save_pressed = true;
        break;
    case 1:
        action.load_pressed = true;
        break;
    case 2:
        action.clear_pressed = true;
        break;
    default:
        break;
    }

    return result;
}

} // namespace framekit
