/// @file scene_renderer.cpp
/// @brief Supports as bars, connectors as hubs with arm stubs, everything else as cubes

#include "rendering/scene_renderer.hpp"

#include "assembly/part_color.hpp"
#include "geometry/grid_transform.hpp"

namespace framekit {

namespace {

// --- Color palette ---
const Color SUPPORT_COLOR = {200, 160, 90, 255};   // Warm wood
const Color CONNECTOR_COLOR = {70, 130, 200, 255}; // Steel blue
const Color LOCKPIN_COLOR = {220, 200, 80, 255};   // Brass
const Color CUSTOM_COLOR = {150, 110, 190, 255};   // Violet
const Color OUTLINE_COLOR = {20, 20, 25, 120};
const Color HOVER_OUTLINE = {255, 235, 120, 255};
const Color GHOST_VALID = {80, 220, 110, 110};
const Color GHOST_SNAPPED = {90, 200, 255, 120};
const Color GHOST_INVALID = {230, 70, 70, 110};
const Color FLOOR_LINE = {60, 60, 70, 255};
const Color FLOOR_AXIS_X = {170, 70, 70, 255};
const Color FLOOR_AXIS_Z = {70, 90, 170, 255};

constexpr float BAR_THICKNESS = 0.34f;
constexpr float HUB_SIZE = 0.6f;
constexpr float ARM_LENGTH = 0.2f;
constexpr float ARM_THICKNESS = 0.4f;
constexpr float LOCKPIN_SIZE = 0.25f;
constexpr float CELL_SIZE = 0.98f;

Color category_color(PartCategory category) {
    switch (category) {
    case PartCategory::SUPPORT:
        return SUPPORT_COLOR;
    case PartCategory::CONNECTOR:
        return CONNECTOR_COLOR;
    case PartCategory::LOCKPIN:
        return LOCKPIN_COLOR;
    case PartCategory::CUSTOM:
        return CUSTOM_COLOR;
    }
    return CUSTOM_COLOR;
}

Vector3 to_world(const GridPosition& cell) {
    return {static_cast<float>(cell.x), static_cast<float>(cell.y), static_cast<float>(cell.z)};
}

/// Box that is long along one axis and thin along the others
Vector3 bar_size(Axis axis, float length, float thickness) {
    switch (axis) {
    case Axis::X:
        return {length, thickness, thickness};
    case Axis::Y:
        return {thickness, length, thickness};
    case Axis::Z:
        return {thickness, thickness, length};
    }
    return {thickness, thickness, thickness};
}

void draw_box(Vector3 center, Vector3 size, Color fill, Color outline) {
    DrawCubeV(center, size, fill);
    DrawCubeWiresV(center, size, outline);
}

/// Draws one definition at a placement with the given fill
void draw_part_shape(const PartDefinition& def, const GridPosition& position,
                     const Rotation& rotation, Axis orientation, Color fill, Color outline) {
    auto cells = world_cells(def, position, rotation, orientation);

    switch (def.category) {
    case PartCategory::SUPPORT: {
        Axis axis = placed_beam_axis(rotation, orientation);
        for (const GridPosition& cell : cells) {
            draw_box(to_world(cell), bar_size(axis, 1.0f, BAR_THICKNESS), fill, outline);
        }
        break;
    }
    case PartCategory::CONNECTOR: {
        for (const GridPosition& cell : cells) {
            Vector3 c = to_world(cell);
            draw_box(c, {HUB_SIZE, HUB_SIZE, HUB_SIZE}, fill, outline);
        }
        // Arm stubs show which way each socket faces
        for (const ConnectionPoint& cp : def.connection_points) {
            GridPosition socket = position + place_cell(cp.offset, rotation, orientation);
            Direction dir = place_direction(cp.direction, rotation, orientation);
            GridPosition step = direction_vector(dir);
            float reach = HUB_SIZE / 2.0f + ARM_LENGTH / 2.0f;
            Vector3 c = to_world(socket);
            c.x += static_cast<float>(step.x) * reach;
            c.y += static_cast<float>(step.y) * reach;
            c.z += static_cast<float>(step.z) * reach;
            draw_box(c, bar_size(direction_axis(dir), ARM_LENGTH, ARM_THICKNESS), fill, outline);
        }
        break;
    }
    case PartCategory::LOCKPIN:
        for (const GridPosition& cell : cells) {
            draw_box(to_world(cell), {LOCKPIN_SIZE, LOCKPIN_SIZE, LOCKPIN_SIZE}, fill, outline);
        }
        break;
    case PartCategory::CUSTOM:
        for (const GridPosition& cell : cells) {
            draw_box(to_world(cell), {CELL_SIZE, CELL_SIZE, CELL_SIZE}, fill, outline);
        }
        break;
    }
}

} // namespace

std::optional<Color> parse_hex_color(const std::string& text) {
    auto rgb = parse_hex_rgb(text);
    if (!rgb) {
        return std::nullopt;
    }
    return Color{rgb->r, rgb->g, rgb->b, 255};
}

void draw_floor(int half_extent) {
    float y = -0.5f;
    float lo = static_cast<float>(-half_extent) - 0.5f;
    float hi = static_cast<float>(half_extent) + 0.5f;
    for (int i = -half_extent; i <= half_extent + 1; i++) {
        float v = static_cast<float>(i) - 0.5f;
        DrawLine3D({v, y, lo}, {v, y, hi}, FLOOR_LINE);
        DrawLine3D({lo, y, v}, {hi, y, v}, FLOOR_LINE);
    }
    DrawLine3D({0.0f, y, 0.0f}, {hi, y, 0.0f}, FLOOR_AXIS_X);
    DrawLine3D({0.0f, y, 0.0f}, {0.0f, y, hi}, FLOOR_AXIS_Z);
}

void draw_assembly(const Assembly& assembly, PartId hovered) {
    const Catalog& catalog = assembly.catalog();
    for (const PlacedPart& part : assembly.get_all_parts()) {
        const PartDefinition* def = catalog.find(part.definition_id);
        if (def == nullptr) {
            continue;
        }
        Color fill = category_color(def->category);
        if (part.color) {
            fill = parse_hex_color(*part.color).value_or(fill);
        }
        Color outline = part.id == hovered ? HOVER_OUTLINE : OUTLINE_COLOR;
        draw_part_shape(*def, part.position, part.rotation, part.effective_orientation(), fill,
                        outline);
    }
}

void draw_ghost(const Ghost& ghost) {
    if (ghost.definition == nullptr) {
        return;
    }
    Color fill = !ghost.valid ? GHOST_INVALID : (ghost.snapped ? GHOST_SNAPPED : GHOST_VALID);
    Color outline = {fill.r, fill.g, fill.b, 255};
    draw_part_shape(*ghost.definition, ghost.position, ghost.rotation, ghost.orientation, fill,
                    outline);
}

} // namespace framekit
