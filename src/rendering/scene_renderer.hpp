/// @file scene_renderer.hpp
/// @brief Draws placed parts and the placement ghost inside BeginMode3D()

#pragma once

#include "assembly/assembly.hpp"
#include "catalog/part_definition.hpp"
#include "geometry/grid_types.hpp"

#include <raylib.h>

#include <optional>
#include <string>

namespace framekit {

/// A part the user is about to place
struct Ghost {
    const PartDefinition* definition = nullptr;
    GridPosition position;
    Rotation rotation;
    Axis orientation = Axis::Y;
    bool valid = false;   ///< Would add_part() accept it
    bool snapped = false; ///< Position came from the snap engine
};

/// Parses "#rrggbb" into an opaque colour
std::optional<Color> parse_hex_color(const std::string& text);

/// Floor grid around the origin
void draw_floor(int half_extent);

/// Every placed part, coloured by category unless it carries its own colour.
/// @param hovered Part drawn with a highlight outline (0 for none)
void draw_assembly(const Assembly& assembly, PartId hovered);

void draw_ghost(const Ghost& ghost);

} // namespace framekit
