/// @file palette_panel.hpp
/// @brief Part palette and placement controls: category tabs, part picker,
///        rotation/orientation buttons, settings toggles and file buttons.
///
/// All UI is drawn using Raylib primitives. The panel reports actions back
/// to the caller, which applies them to the assembly after EndDrawing().

#pragma once

#include "catalog/catalog.hpp"
#include "geometry/grid_types.hpp"

#include <raylib.h>

#include <array>
#include <string>

namespace framekit {

/// Actions the palette can request from the main loop
struct PaletteAction {
    bool selection_changed = false; ///< Different part picked
    bool snap_toggled = false;
    bool collision_toggled = false;
    bool save_pressed = false;
    bool load_pressed = false;
    bool clear_pressed = false;
};

struct PalettePanelResult {
    PaletteAction action;
    float panel_height = 0.0f;
};

/// Categories offered as palette tabs, in tab order
inline constexpr std::array<PartCategory, 4> PALETTE_TABS = {
    PartCategory::SUPPORT, PartCategory::CONNECTOR, PartCategory::LOCKPIN, PartCategory::CUSTOM};

/// Persistent UI state, kept across frames
struct UIState {
    int tab = 0;                              ///< Index into PALETTE_TABS
    std::array<int, 4> picked = {2, 0, 0, 0}; ///< Selected entry per tab (support-3u first)
    Rotation rotation;
    Axis orientation = Axis::Y;

    // Mirrors of AssemblySettings, edited here and pushed to the model
    bool snap_enabled = true;
    bool custom_skip_collision = false;

    std::string status = "Left click to place, Del to remove hovered part";
};

/// The definition currently picked in the palette, or nullptr if the tab is empty
const PartDefinition* selected_definition(const Catalog& catalog, const UIState& state);

/// Draws the palette panel and handles mouse interaction.
/// @param state   Mutable UI state (persists across frames)
/// @param catalog Source of the listed parts
/// @param panel_x Left edge of the panel in screen coordinates
/// @param panel_y Top edge of the panel in screen coordinates
/// @param panel_w Width of the panel
/// @return Actions and rendered panel height for stacking the BOM panel below
PalettePanelResult draw_palette_panel(UIState& state, const Catalog& catalog, float panel_x,
                                      float panel_y, float panel_w);

} // namespace framekit
