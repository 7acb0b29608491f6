#pragma once

/// @file snap_engine.hpp
/// @brief Attachment candidates between connectors and supports
///
/// All functions are read-only queries over an Assembly. Two directions:
///
///   placing a support   — find_snap_points(): open connector sockets that a
///                         support end could slide into
///   placing a connector — find_connector_snap_points(): support ends the
///                         connector could cap, plus mid-span cells for
///                         pull-through connectors
///
/// Candidates are ranked by a cursor distance that takes the best of the
/// ground-plane (XZ) distance and the pick-ray distance, so elevated
/// targets stay reachable while the cursor projects onto the floor.

#include "assembly/assembly.hpp"
#include "geometry/grid_types.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace framekit {

/// Default search radius, in grid units
inline constexpr double DEFAULT_SNAP_RADIUS = 3.0;

/// A point or direction in continuous grid coordinates
struct GridVec {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/// Pick ray in grid coordinates
struct GridRay {
    GridVec origin;
    GridVec direction;
};

struct SnapCandidate {
    GridPosition position;       ///< Where the part origin should go
    Axis orientation = Axis::Y;  ///< Orientation the part needs to align
    PartId anchor_part_id = 0;   ///< The placed part offering this snap
    Direction socket_direction = Direction::POS_Y;
    double distance = 0.0;       ///< Sort key (lower is better)
    std::optional<Rotation> auto_rotation;
};

/// Closest distance from a ray (t >= 0) to a point
[[nodiscard]] double ray_to_point_distance(const GridRay& ray, const GridPosition& point);

/// Sort and filter distances for one target cell
struct SnapDistance {
    double sort = 0.0;
    double filter = 0.0;
};

[[nodiscard]] SnapDistance snap_distance(const GridPosition& cursor, const GridPosition& target,
                                         const std::optional<GridRay>& ray);

/// Open sockets a support could plug into, nearest first
[[nodiscard]] std::vector<SnapCandidate>
find_snap_points(const Assembly& assembly, std::string_view support_def_id,
                 const GridPosition& cursor, double max_distance = DEFAULT_SNAP_RADIUS,
                 const std::optional<GridRay>& ray = std::nullopt);

[[nodiscard]] std::optional<SnapCandidate>
find_best_snap(const Assembly& assembly, std::string_view support_def_id,
               const GridPosition& cursor, double max_distance = DEFAULT_SNAP_RADIUS,
               const std::optional<GridRay>& ray = std::nullopt);

/// Support ends (and pull-through mid-spans) a connector could attach to,
/// nearest first. connector_rotation orients the pull-through axis.
[[nodiscard]] std::vector<SnapCandidate>
find_connector_snap_points(const Assembly& assembly, std::string_view connector_def_id,
                           const GridPosition& cursor, double max_distance = DEFAULT_SNAP_RADIUS,
                           const std::optional<GridRay>& ray = std::nullopt,
                           const std::optional<Rotation>& connector_rotation = std::nullopt);

/// Best connector candidate with auto_rotation filled in so that its arms
/// face as many of the supports converging on that cell as possible
[[nodiscard]] std::optional<SnapCandidate>
find_best_connector_snap(const Assembly& assembly, std::string_view connector_def_id,
                         const GridPosition& cursor, double max_distance = DEFAULT_SNAP_RADIUS,
                         const std::optional<GridRay>& ray = std::nullopt,
                         const std::optional<Rotation>& connector_rotation = std::nullopt);

} // namespace framekit
