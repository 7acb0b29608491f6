/// @file bom_panel.hpp
/// @brief Bill-of-materials panel listing part quantities by category.

#pragma once

#include "bom/bom.hpp"

#include <raylib.h>

#include <vector>

namespace framekit {

/// Draws the BOM panel:
/// - one row per entry (quantity, name), grouped by category
/// - a total part count
/// Rows that do not fit in max_h are summarised as "+N more".
/// @param bom     Entries from get_bom()
/// @param panel_x Left edge of panel in screen coords
/// @param panel_y Top edge of panel in screen coords
/// @param panel_w Width of the panel
/// @param max_h   Height available below panel_y
/// @return Rendered panel height.
float draw_bom_panel(const std::vector<BomEntry>& bom, float panel_x, float panel_y, float panel_w,
                     float max_h);

} // namespace framekit
