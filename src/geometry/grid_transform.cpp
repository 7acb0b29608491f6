/// @file grid_transform.cpp
/// @brief Quarter-turn rotation composition and orientation remap

#include "geometry/grid_transform.hpp"

#include <algorithm>

namespace framekit {

namespace {

/// One quarter turn about a single axis (right-hand rule)
GridPosition rotate_once(const GridPosition& c, Axis axis) {
    switch (axis) {
    case Axis::X:
        return {c.x, -c.z, c.y};
    case Axis::Y:
        return {c.z, c.y, -c.x};
    case Axis::Z:
        return {-c.y, c.x, c.z};
    }
    return c;
}

} // namespace

GridPosition direction_vector(Direction dir) {
    switch (dir) {
    case Direction::POS_X:
        return {1, 0, 0};
    case Direction::NEG_X:
        return {-1, 0, 0};
    case Direction::POS_Y:
        return {0, 1, 0};
    case Direction::NEG_Y:
        return {0, -1, 0};
    case Direction::POS_Z:
        return {0, 0, 1};
    case Direction::NEG_Z:
        return {0, 0, -1};
    }
    return {0, 1, 0};
}

Direction vector_direction(const GridPosition& v) {
    if (v.x >= 1) {
        return Direction::POS_X;
    }
    if (v.x <= -1) {
        return Direction::NEG_X;
    }
    if (v.y >= 1) {
        return Direction::POS_Y;
    }
    if (v.y <= -1) {
        return Direction::NEG_Y;
    }
    if (v.z >= 1) {
        return Direction::POS_Z;
    }
    return Direction::NEG_Z;
}

Axis direction_axis(Direction dir) {
    switch (dir) {
    case Direction::POS_X:
    case Direction::NEG_X:
        return Axis::X;
    case Direction::POS_Y:
    case Direction::NEG_Y:
        return Axis::Y;
    case Direction::POS_Z:
    case Direction::NEG_Z:
        return Axis::Z;
    }
    return Axis::Y;
}

bool is_positive(Direction dir) {
    return dir == Direction::POS_X || dir == Direction::POS_Y || dir == Direction::POS_Z;
}

Direction opposite(Direction dir) {
    switch (dir) {
    case Direction::POS_X:
        return Direction::NEG_X;
    case Direction::NEG_X:
        return Direction::POS_X;
    case Direction::POS_Y:
        return Direction::NEG_Y;
    case Direction::NEG_Y:
        return Direction::POS_Y;
    case Direction::POS_Z:
        return Direction::NEG_Z;
    case Direction::NEG_Z:
        return Direction::POS_Z;
    }
    return dir;
}

Direction positive_direction(Axis axis) {
    switch (axis) {
    case Axis::X:
        return Direction::POS_X;
    case Axis::Y:
        return Direction::POS_Y;
    case Axis::Z:
        return Direction::POS_Z;
    }
    return Direction::POS_Y;
}

GridPosition adjacent(const GridPosition& pos, Direction dir) {
    return pos + direction_vector(dir);
}

Axis next_orientation(Axis current) {
    switch (current) {
    case Axis::Y:
        return Axis::X;
    case Axis::X:
        return Axis::Z;
    case Axis::Z:
        return Axis::Y;
    }
    return Axis::Y;
}

GridPosition rotate_cell(const GridPosition& cell, const Rotation& rotation) {
    if (rotation.is_identity()) {
        return cell;
    }
    GridPosition result = cell;
    // Z first, then Y, then X
    for (Axis axis : {Axis::Z, Axis::Y, Axis::X}) {
        int steps = rotation.steps(axis);
        for (int s = 0; s < steps; s++) {
            result = rotate_once(result, axis);
        }
    }
    return result;
}

Direction rotate_direction(Direction dir, const Rotation& rotation) {
    return vector_direction(rotate_cell(direction_vector(dir), rotation));
}

Axis rotate_axis(Axis axis, const Rotation& rotation) {
    return direction_axis(rotate_direction(positive_direction(axis), rotation));
}

GridPosition transform_cell(const GridPosition& cell, Axis orientation) {
    switch (orientation) {
    case Axis::Y:
        return cell;
    case Axis::X:
        return {cell.y, cell.x, cell.z};
    case Axis::Z:
        return {cell.x, cell.z, cell.y};
    }
    return cell;
}

Direction transform_direction(Direction dir, Axis orientation) {
    return vector_direction(transform_cell(direction_vector(dir), orientation));
}

Axis transform_axis(Axis axis, Axis orientation) {
    return direction_axis(transform_direction(positive_direction(axis), orientation));
}

GridPosition place_cell(const GridPosition& cell, const Rotation& rotation, Axis orientation) {
    return transform_cell(rotate_cell(cell, rotation), orientation);
}

Direction place_direction(Direction dir, const Rotation& rotation, Axis orientation) {
    return transform_direction(rotate_direction(dir, rotation), orientation);
}

std::vector<GridPosition> world_cells(const PartDefinition& def, const GridPosition& position,
                                      const Rotation& rotation, Axis orientation) {
    std::vector<GridPosition> cells;
    cells.reserve(def.grid_cells.size());
    for (const GridPosition& cell : def.grid_cells) {
        cells.push_back(position + place_cell(cell, rotation, orientation));
    }
    return cells;
}

Axis placed_beam_axis(const Rotation& rotation, Axis orientation) {
    return direction_axis(place_direction(Direction::POS_Y, rotation, orientation));
}

int compute_ground_lift(const PartDefinition& def, const Rotation& rotation, Axis orientation) {
    int min_y = 0;
    for (const GridPosition& cell : def.grid_cells) {
        min_y = std::min(min_y, place_cell(cell, rotation, orientation).y);
    }
    if (def.is_connector()) {
        for (const ConnectionPoint& cp : def.connection_points) {
            GridPosition base = place_cell(cp.offset, rotation, orientation);
            GridPosition arm = adjacent(base, place_direction(cp.direction, rotation, orientation));
            min_y = std::min(min_y, arm.y);
        }
    }
    return std::max(0, -min_y);
}

} // namespace framekit
