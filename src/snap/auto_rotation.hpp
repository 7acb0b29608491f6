#pragma once

/// @file auto_rotation.hpp
/// @brief Brute-force search for the connector rotation that faces needed directions

#include "catalog/catalog.hpp"
#include "geometry/grid_types.hpp"

#include <string_view>
#include <vector>

namespace framekit {

/// Minimal number of quarter turns between two rotations, summed over axes
[[nodiscard]] int rotation_distance(const Rotation& a, const Rotation& b);

/// How many of needed are matched by the connector's female arms under rotation
[[nodiscard]] int arm_coverage(const PartDefinition& def, const std::vector<Direction>& needed,
                               const Rotation& rotation);

/// Evaluates all 64 quarter-turn combinations and picks the one whose female
/// arms cover the most needed directions, breaking ties by closeness to
/// fallback. Since fallback is among the candidates, the result never covers
/// fewer directions than fallback does.
///
/// Returns fallback unchanged if needed is empty, the id is unknown, or the
/// part has no female arms.
[[nodiscard]] Rotation compute_auto_rotation(const Catalog& catalog,
                                             std::string_view connector_def_id,
                                             const std::vector<Direction>& needed,
                                             const Rotation& fallback);

} // namespace framekit
