#pragma once

/// @file grid_types.hpp
/// @brief Integer grid positions, axes, directions and 90-degree rotations

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace framekit {

/// A cell on the integer grid. One unit is one BASE_UNIT of physical length.
struct GridPosition {
    int x = 0;
    int y = 0;
    int z = 0;

    [[nodiscard]] int operator[](int index) const { return index == 0 ? x : (index == 1 ? y : z); }
    int& operator[](int index) { return index == 0 ? x : (index == 1 ? y : z); }
};

inline bool operator==(const GridPosition& a, const GridPosition& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const GridPosition& a, const GridPosition& b) {
    return !(a == b);
}

inline GridPosition operator+(const GridPosition& a, const GridPosition& b) {
    return {a.x + b.x, a.y + b.y, a.z + b.z};
}

inline GridPosition operator-(const GridPosition& a, const GridPosition& b) {
    return {a.x - b.x, a.y - b.y, a.z - b.z};
}

struct GridPositionHash {
    std::size_t operator()(const GridPosition& p) const {
        // Pack three 21-bit lanes; collisions only outside +-1M cells.
        auto lane = [](int v) { return static_cast<std::uint64_t>(v) & 0x1FFFFFu; };
        return std::hash<std::uint64_t>{}(lane(p.x) | (lane(p.y) << 21) | (lane(p.z) << 42));
    }
};

/// One of the three principal axes
enum class Axis { X, Y, Z };

/// One of the six signed axis directions
enum class Direction { POS_X, NEG_X, POS_Y, NEG_Y, POS_Z, NEG_Z };

[[nodiscard]] constexpr int axis_index(Axis axis) {
    switch (axis) {
    case Axis::X:
        return 0;
    case Axis::Y:
        return 1;
    case Axis::Z:
        return 2;
    }
    return 1;
}

[[nodiscard]] constexpr std::string_view axis_name(Axis axis) {
    switch (axis) {
    case Axis::X:
        return "x";
    case Axis::Y:
        return "y";
    case Axis::Z:
        return "z";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view direction_name(Direction dir) {
    switch (dir) {
    case Direction::POS_X:
        return "+x";
    case Direction::NEG_X:
        return "-x";
    case Direction::POS_Y:
        return "+y";
    case Direction::NEG_Y:
        return "-y";
    case Direction::POS_Z:
        return "+z";
    case Direction::NEG_Z:
        return "-z";
    }
    return "?";
}

/// Parses "x", "y" or "z"
[[nodiscard]] std::optional<Axis> parse_axis(std::string_view text);

/// Parses "+x", "-y", ...
[[nodiscard]] std::optional<Direction> parse_direction(std::string_view text);

/// Three independent quarter-turn angles, in degrees, about X, Y and Z.
///
/// Each component is one of 0, 90, 180, 270. When applied to geometry the
/// Z rotation goes first, then Y, then X (see grid_transform.hpp).
struct Rotation {
    int x = 0;
    int y = 0;
    int z = 0;

    /// Builds a rotation from arbitrary multiples of 90, normalised into 0..270.
    /// @throws std::invalid_argument if a component is not a multiple of 90
    [[nodiscard]] static Rotation from_degrees(int x_deg, int y_deg, int z_deg);

    [[nodiscard]] bool is_identity() const { return x == 0 && y == 0 && z == 0; }

    /// Number of quarter turns (0..3) about the given axis
    [[nodiscard]] int steps(Axis axis) const;
};

inline bool operator==(const Rotation& a, const Rotation& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Rotation& a, const Rotation& b) {
    return !(a == b);
}

} // namespace framekit
