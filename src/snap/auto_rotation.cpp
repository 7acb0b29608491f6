/// @file auto_rotation.cpp
/// @brief 64-combination rotation search

#include "snap/auto_rotation.hpp"

#include "geometry/grid_transform.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace framekit {

namespace {

constexpr std::array<int, 4> QUARTER_TURNS = {0, 90, 180, 270};

int axis_distance(int a_deg, int b_deg) {
    int diff = (((a_deg - b_deg) % 360) + 360) % 360;
    return std::min(diff, 360 - diff) / 90;
}

std::vector<Direction> female_arms(const PartDefinition& def) {
    std::vector<Direction> arms;
    for (const ConnectionPoint& cp : def.connection_points) {
        if (cp.role == ConnectionRole::FEMALE) {
            arms.push_back(cp.direction);
        }
    }
    return arms;
}

int coverage_of(const std::vector<Direction>& base_arms, const std::vector<Direction>& needed,
                const Rotation& rotation) {
    std::vector<Direction> rotated;
    rotated.reserve(base_arms.size());
    for (Direction arm : base_arms) {
        rotated.push_back(rotate_direction(arm, rotation));
    }
    int coverage = 0;
    for (Direction dir : needed) {
        if (std::find(rotated.begin(), rotated.end(), dir) != rotated.end()) {
            coverage++;
        }
    }
    return coverage;
}

} // namespace

int rotation_distance(const Rotation& a, const Rotation& b) {
    return axis_distance(a.x, b.x) + axis_distance(a.y, b.y) + axis_distance(a.z, b.z);
}

int arm_coverage(const PartDefinition& def, const std::vector<Direction>& needed,
                 const Rotation& rotation) {
    return coverage_of(female_arms(def), needed, rotation);
}

Rotation compute_auto_rotation(const Catalog& catalog, std::string_view connector_def_id,
                               const std::vector<Direction>& needed, const Rotation& fallback) {
    if (needed.empty()) {
        return fallback;
    }
    const PartDefinition* def = catalog.find(connector_def_id);
    if (def == nullptr) {
        return fallback;
    }
    std::vector<Direction> base_arms = female_arms(*def);
    if (base_arms.empty()) {
        return fallback;
    }

    Rotation best = fallback;
    int best_coverage = -1;
    int best_distance = 0;

    for (int rx : QUARTER_TURNS) {
        for (int ry : QUARTER_TURNS) {
            for (int rz : QUARTER_TURNS) {
                Rotation candidate{rx, ry, rz};
                int coverage = coverage_of(base_arms, needed, candidate);
                int distance = rotation_distance(candidate, fallback);
                if (coverage > best_coverage ||
                    (coverage == best_coverage && distance < best_distance)) {
                    best = candidate;
                    best_coverage = coverage;
                    best_distance = distance;
                }
            }
        }
    }
    return best;
}

} // namespace framekit
