#pragma once

/// @file cell_occupant.hpp
/// @brief Per-cell occupancy records and the single coexistence rule

#include "geometry/grid_types.hpp"

#include <cstdint>
#include <optional>

namespace framekit {

using PartId = uint32_t;

/// How a part claims a cell: a support is a thin bar along one axis and
/// leaves the other two axes free, anything else takes the whole cell.
struct CellClaim {
    bool full = true;
    Axis axis = Axis::Y; ///< Only meaningful for beam claims

    [[nodiscard]] static CellClaim whole_cell() { return {true, Axis::Y}; }
    [[nodiscard]] static CellClaim beam(Axis axis) { return {false, axis}; }
};

inline bool operator==(const CellClaim& a, const CellClaim& b) {
    return a.full == b.full && (a.full || a.axis == b.axis);
}

/// One entry in a cell's occupant list
struct CellOccupant {
    PartId owner = 0;
    CellClaim claim;
    std::optional<Axis> pull_through_axis; ///< Effective (rotated) pull-through axis
};

/// Decides whether a new claim may share a cell with an existing occupant.
///
///   beam  + beam  — allowed only on different axes
///   full  + any   — blocked, unless the full occupant is a pull-through part
///                   whose effective axis equals the beam's axis
///
/// The rule is symmetric in which of the two was placed first.
[[nodiscard]] bool can_coexist(const CellOccupant& existing, const CellClaim& incoming,
                               std::optional<Axis> incoming_pull_through);

} // namespace framekit
