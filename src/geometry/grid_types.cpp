/// @file grid_types.cpp
/// @brief Parsing and normalisation helpers for grid primitives

#include "geometry/grid_types.hpp"

#include <stdexcept>
#include <string>

namespace framekit {

namespace {

int normalise_degrees(int degrees) {
    if (degrees % 90 != 0) {
        throw std::invalid_argument("Rotation must be a multiple of 90 degrees, got " +
                                    std::to_string(degrees));
    }
    return ((degrees % 360) + 360) % 360;
}

} // namespace

std::optional<Axis> parse_axis(std::string_view text) {
    if (text == "x") {
        return Axis::X;
    }
    if (text == "y") {
        return Axis::Y;
    }
    if (text == "z") {
        return Axis::Z;
    }
    return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view text) {
    if (text == "+x") {
        return Direction::POS_X;
    }
    if (text == "-x") {
        return Direction::NEG_X;
    }
    if (text == "+y") {
        return Direction::POS_Y;
    }
    if (text == "-y") {
        return Direction::NEG_Y;
    }
    if (text == "+z") {
        return Direction::POS_Z;
    }
    if (text == "-z") {
        return Direction::NEG_Z;
    }
    return std::nullopt;
}

Rotation Rotation::from_degrees(int x_deg, int y_deg, int z_deg) {
    return {normalise_degrees(x_deg), normalise_degrees(y_deg), normalise_degrees(z_deg)};
}

int Rotation::steps(Axis axis) const {
    int degrees = axis == Axis::X ? x : (axis == Axis::Y ? y : z);
    return (((degrees / 90) % 4) + 4) % 4;
}

} // namespace framekit
