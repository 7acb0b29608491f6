#pragma once

/// @file grid_transform.hpp
/// @brief Quarter-turn rotation, beam orientation remap and ground lift
///
/// Two independent transforms act on authored geometry:
///
///   rotation    — up to three quarter-turn steps per axis, composed Z, then Y,
///                 then X, using right-hand-rule swaps:
///                   about X: (x, y, z) -> (x, -z, y)
///                   about Y: (x, y, z) -> (z, y, -x)
///                   about Z: (x, y, z) -> (-y, x, z)
///   orientation — a component swap that moves a beam authored along Y onto
///                 another axis ("y" identity, "x" swaps 0/1, "z" swaps 1/2).
///
/// Placed geometry is always rotated first, then oriented. place_cell() and
/// place_direction() are the only entry points the model uses.

#include "catalog/part_definition.hpp"
#include "geometry/grid_types.hpp"

#include <vector>

namespace framekit {

// --- Direction helpers ---

/// Unit vector of a direction
[[nodiscard]] GridPosition direction_vector(Direction dir);

/// Direction of an axis-aligned unit vector, checking x, then y, then z
/// against the +-1 threshold. Anything else maps to -Z.
[[nodiscard]] Direction vector_direction(const GridPosition& v);

[[nodiscard]] Axis direction_axis(Direction dir);
[[nodiscard]] bool is_positive(Direction dir);
[[nodiscard]] Direction opposite(Direction dir);
[[nodiscard]] Direction positive_direction(Axis axis);

/// The neighbouring cell one step along dir
[[nodiscard]] GridPosition adjacent(const GridPosition& pos, Direction dir);

/// Cycles support orientation: y -> x -> z -> y
[[nodiscard]] Axis next_orientation(Axis current);

// --- Rotation ---

[[nodiscard]] GridPosition rotate_cell(const GridPosition& cell, const Rotation& rotation);
[[nodiscard]] Direction rotate_direction(Direction dir, const Rotation& rotation);
[[nodiscard]] Axis rotate_axis(Axis axis, const Rotation& rotation);

// --- Orientation remap ---

[[nodiscard]] GridPosition transform_cell(const GridPosition& cell, Axis orientation);
[[nodiscard]] Direction transform_direction(Direction dir, Axis orientation);
[[nodiscard]] Axis transform_axis(Axis axis, Axis orientation);

// --- Canonical placement (rotate, then orient) ---

[[nodiscard]] GridPosition place_cell(const GridPosition& cell, const Rotation& rotation,
                                      Axis orientation);
[[nodiscard]] Direction place_direction(Direction dir, const Rotation& rotation, Axis orientation);

/// Absolute cells a definition covers at a position
[[nodiscard]] std::vector<GridPosition> world_cells(const PartDefinition& def,
                                                    const GridPosition& position,
                                                    const Rotation& rotation, Axis orientation);

/// The axis a support actually spans once placed. Equals the orientation
/// whenever the rotation is identity.
[[nodiscard]] Axis placed_beam_axis(const Rotation& rotation, Axis orientation);

/// Minimum upward shift that keeps every placed cell (and, for connectors,
/// every arm's neighbouring cell) at Y >= 0. A placement hint, not a check.
[[nodiscard]] int compute_ground_lift(const PartDefinition& def, const Rotation& rotation,
                                      Axis orientation);

} // namespace framekit
