#pragma once

/// @file part_definition.hpp
/// @brief Authored part records — category, connection points, occupied cells

#include "geometry/grid_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framekit {

/// Closed set of part kinds. The category is the tag that decides how a part
/// occupies the grid: supports are thin bars, everything else fills its cells.
enum class PartCategory { SUPPORT, CONNECTOR, LOCKPIN, CUSTOM };

[[nodiscard]] constexpr std::string_view category_name(PartCategory category) {
    switch (category) {
    case PartCategory::SUPPORT:
        return "support";
    case PartCategory::CONNECTOR:
        return "connector";
    case PartCategory::LOCKPIN:
        return "lockpin";
    case PartCategory::CUSTOM:
        return "custom";
    }
    return "unknown";
}

/// male = support end, female = connector socket
enum class ConnectionRole { MALE, FEMALE };

/// A point where other parts attach, relative to the part origin
struct ConnectionPoint {
    GridPosition offset;
    Direction direction = Direction::POS_Y;
    ConnectionRole role = ConnectionRole::FEMALE;
};

/// Immutable catalog entry.
///
/// Cells and connection points are authored unrotated; supports are always
/// authored along +Y starting at the origin.
struct PartDefinition {
    std::string id;
    PartCategory category = PartCategory::CUSTOM;
    std::string name;
    std::string description;
    std::vector<ConnectionPoint> connection_points;
    std::vector<GridPosition> grid_cells;

    /// Axis along which a support may pass through this part's own cell
    std::optional<Axis> pull_through_axis;

    [[nodiscard]] bool is_support() const { return category == PartCategory::SUPPORT; }
    [[nodiscard]] bool is_connector() const { return category == PartCategory::CONNECTOR; }
};

} // namespace framekit
