/// @file camera_rig.hpp
/// @brief Orbit camera and cursor picking against the grid.
///
/// World space and grid space coincide: the centre of cell (x, y, z) sits at
/// world (x, y, z), so the floor of the bottom layer is the plane y = -0.5.

#pragma once

#include "geometry/grid_types.hpp"
#include "snap/snap_engine.hpp"

#include <raylib.h>

#include <optional>

namespace framekit {

/// World Y of the ground plane (bottom face of layer 0)
inline constexpr float GROUND_PLANE_Y = -0.5f;

enum class CameraDrag { NONE, ORBIT, PAN };

/// Turntable camera state, kept across frames
struct CameraRig {
    Camera3D camera{};
    CameraDrag drag = CameraDrag::NONE;
};

/// A camera looking at the origin from the front-right, above the floor
CameraRig make_camera_rig();

/// Applies mouse orbit (right drag), pan (middle drag) and wheel zoom.
/// @param mouse_in_viewport False while the cursor is over a UI panel
void update_camera_rig(CameraRig& rig, bool mouse_in_viewport);

/// Mouse ray in grid coordinates
GridRay pick_ray(const Camera3D& camera);

/// Grid cell at layer 0 under the mouse, or nullopt if the ray misses the floor
std::optional<GridPosition> pick_ground_cell(const Camera3D& camera);

} // namespace framekit
