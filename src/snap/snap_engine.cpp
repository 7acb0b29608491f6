/// @file snap_engine.cpp
/// @brief Socket and endpoint candidate search

#include "snap/snap_engine.hpp"

#include "geometry/grid_transform.hpp"
#include "snap/auto_rotation.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace framekit {

namespace {

void sort_candidates(std::vector<SnapCandidate>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const SnapCandidate& a, const SnapCandidate& b) {
                         return a.distance < b.distance;
                     });
}

/// Appends a candidate if its target cell lies inside the search radius
void offer(std::vector<SnapCandidate>& out, SnapCandidate candidate, const GridPosition& target,
           const GridPosition& cursor, double max_distance, const std::optional<GridRay>& ray) {
    SnapDistance d = snap_distance(cursor, target, ray);
    if (d.filter > max_distance) {
        return;
    }
    candidate.distance = d.sort;
    out.push_back(std::move(candidate));
}

void add_pull_through_candidates(std::vector<SnapCandidate>& out, const Assembly& assembly,
                                 Axis pull_through, const GridPosition& cursor,
                                 double max_distance, const std::optional<GridRay>& ray) {
    const Catalog& catalog = assembly.catalog();
    for (const PlacedPart& part : assembly.get_all_parts()) {
        const PartDefinition* def = catalog.find(part.definition_id);
        if (def == nullptr || !def->is_support()) {
            continue;
        }
        if (part.effective_orientation() != pull_through) {
            continue;
        }

        auto cells = world_cells(*def, part.position, part.rotation, part.effective_orientation());
        // Endpoints are capped by ordinary connectors, so only mid-span cells qualify
        for (size_t i = 1; i + 1 < cells.size(); i++) {
            if (cells[i].y < 0) {
                continue;
            }
            SnapCandidate c;
            c.position = cells[i];
            c.orientation = Axis::Y;
            c.anchor_part_id = part.id;
            c.socket_direction = positive_direction(pull_through);
            offer(out, c, cells[i], cursor, max_distance, ray);
        }
    }
}

void add_endpoint_candidates(std::vector<SnapCandidate>& out, const Assembly& assembly,
                             const GridPosition& cursor, double max_distance,
                             const std::optional<GridRay>& ray) {
    const Catalog& catalog = assembly.catalog();
    for (const PlacedPart& part : assembly.get_all_parts()) {
        const PartDefinition* def = catalog.find(part.definition_id);
        if (def == nullptr) {
            continue;
        }
        bool has_male = std::any_of(def->connection_points.begin(), def->connection_points.end(),
                                    [](const ConnectionPoint& cp) {
                                        return cp.role == ConnectionRole::MALE;
                                    });
        if (!has_male) {
            continue;
        }

        auto cells = world_cells(*def, part.position, part.rotation, part.effective_orientation());
        if (cells.size() < 2) {
            continue;
        }

        const GridPosition& first = cells.front();
        const GridPosition& last = cells.back();
        const std::pair<GridPosition, Direction> ends[] = {
            {first, vector_direction(first - cells[1])},
            {last, vector_direction(last - cells[cells.size() - 2])},
        };

        for (const auto& [endpoint, dir] : ends) {
            GridPosition target = adjacent(endpoint, dir);
            if (target.y < 0 || assembly.is_occupied(target)) {
                continue;
            }
            SnapCandidate c;
            c.position = target;
            c.orientation = Axis::Y;
            c.anchor_part_id = part.id;
            c.socket_direction = dir;
            offer(out, c, target, cursor, max_distance, ray);
        }
    }
}

} // namespace

double ray_to_point_distance(const GridRay& ray, const GridPosition& point) {
    double ox = point.x - ray.origin.x;
    double oy = point.y - ray.origin.y;
    double oz = point.z - ray.origin.z;
    double dx = ray.direction.x;
    double dy = ray.direction.y;
    double dz = ray.direction.z;

    double len_sq = dx * dx + dy * dy + dz * dz;
    if (len_sq == 0.0) {
        return std::sqrt(ox * ox + oy * oy + oz * oz);
    }

    double t = std::max(0.0, (ox * dx + oy * dy + oz * dz) / len_sq);
    double cx = ray.origin.x + t * dx - point.x;
    double cy = ray.origin.y + t * dy - point.y;
    double cz = ray.origin.z + t * dz - point.z;
    return std::sqrt(cx * cx + cy * cy + cz * cz);
}

SnapDistance snap_distance(const GridPosition& cursor, const GridPosition& target,
                           const std::optional<GridRay>& ray) {
    double dx = cursor.x - target.x;
    double dy = cursor.y - target.y;
    double dz = cursor.z - target.z;
    double distance_3d = std::sqrt(dx * dx + dy * dy + dz * dz);
    double distance_xz = std::sqrt(dx * dx + dz * dz);

    double ray_distance =
        ray ? ray_to_point_distance(*ray, target) : std::numeric_limits<double>::infinity();

    SnapDistance d;
    d.filter = std::min(distance_xz, ray_distance);
    d.sort = d.filter + distance_3d * 0.01;
    return d;
}

std::vector<SnapCandidate> find_snap_points(const Assembly& assembly,
                                            std::string_view support_def_id,
                                            const GridPosition& cursor, double max_distance,
                                            const std::optional<GridRay>& ray) {
    std::vector<SnapCandidate> candidates;
    const Catalog& catalog = assembly.catalog();
    const PartDefinition* support = catalog.find(support_def_id);
    if (support == nullptr || !support->is_support()) {
        return candidates;
    }
    const int length = static_cast<int>(support->grid_cells.size());

    for (const PlacedPart& part : assembly.get_all_parts()) {
        const PartDefinition* def = catalog.find(part.definition_id);
        if (def == nullptr || !def->is_connector()) {
            continue;
        }

        for (const ConnectionPoint& cp : def->connection_points) {
            if (cp.role != ConnectionRole::FEMALE) {
                continue;
            }

            Axis orient = part.effective_orientation();
            GridPosition socket = part.position + place_cell(cp.offset, part.rotation, orient);
            Direction dir = place_direction(cp.direction, part.rotation, orient);
            GridPosition target = adjacent(socket, dir);

            // Filled sockets are not offered
            if (assembly.is_occupied(target)) {
                continue;
            }

            Axis axis = direction_axis(dir);
            GridPosition origin = target;
            if (!is_positive(dir)) {
                // Support extends towards the socket, so its origin sits at the far end
                switch (axis) {
                case Axis::X: origin.x -= length - 1; break;
                case Axis::Y: origin.y -= length - 1; break;
                case Axis::Z: origin.z -= length - 1; break;
                }
            }

            SnapCandidate c;
            c.position = origin;
            c.orientation = axis;
            c.anchor_part_id = part.id;
            c.socket_direction = dir;
            offer(candidates, c, target, cursor, max_distance, ray);
        }
    }

    sort_candidates(candidates);
    return candidates;
}

std::optional<SnapCandidate> find_best_snap(const Assembly& assembly,
                                            std::string_view support_def_id,
                                            const GridPosition& cursor, double max_distance,
                                            const std::optional<GridRay>& ray) {
    auto candidates = find_snap_points(assembly, support_def_id, cursor, max_distance, ray);
    if (candidates.empty()) {
        return std::nullopt;
    }
    return candidates.front();
}

std::vector<SnapCandidate>
find_connector_snap_points(const Assembly& assembly, std::string_view connector_def_id,
                           const GridPosition& cursor, double max_distance,
                           const std::optional<GridRay>& ray,
                           const std::optional<Rotation>& connector_rotation) {
    std::vector<SnapCandidate> candidates;
    const PartDefinition* connector = assembly.catalog().find(connector_def_id);
    if (connector == nullptr) {
        return candidates;
    }

    if (connector->pull_through_axis) {
        Axis pull_through =
            rotate_axis(*connector->pull_through_axis, connector_rotation.value_or(Rotation{}));
        add_pull_through_candidates(candidates, assembly, pull_through, cursor, max_distance, ray);
    }
    add_endpoint_candidates(candidates, assembly, cursor, max_distance, ray);

    sort_candidates(candidates);
    return candidates;
}

std::optional<SnapCandidate>
find_best_connector_snap(const Assembly& assembly, std::string_view connector_def_id,
                         const GridPosition& cursor, double max_distance,
                         const std::optional<GridRay>& ray,
                         const std::optional<Rotation>& connector_rotation) {
    auto candidates = find_connector_snap_points(assembly, connector_def_id, cursor, max_distance,
                                                 ray, connector_rotation);
    if (candidates.empty()) {
        return std::nullopt;
    }

    SnapCandidate best = candidates.front();

    // Every support converging on the chosen cell wants an arm pointing back at it
    std::vector<Direction> needed;
    for (const SnapCandidate& c : candidates) {
        if (c.position != best.position) {
            continue;
        }
        Direction arm = opposite(c.socket_direction);
        if (std::find(needed.begin(), needed.end(), arm) == needed.end()) {
            needed.push_back(arm);
        }
    }

    best.auto_rotation = compute_auto_rotation(assembly.catalog(), connector_def_id, needed,
                                               connector_rotation.value_or(Rotation{}));
    return best;
}

} // namespace framekit
