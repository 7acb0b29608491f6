/// @file camera_rig.cpp
/// @brief Turntable orbit, pan, dolly and floor picking

#include "rendering/camera_rig.hpp"

#include <raymath.h>

#include <algorithm>
#include <cmath>

namespace framekit {

namespace {

constexpr float ORBIT_SPEED = 0.006f;
constexpr float PAN_SPEED = 0.002f;
constexpr float ZOOM_SPEED = 0.12f;
constexpr float PITCH_LIMIT = 1.55f; // Just under 90 degrees
constexpr float MIN_DISTANCE = 2.0f;
constexpr float MAX_DISTANCE = 200.0f;

void orbit(Camera3D& camera, Vector2 delta) {
    Vector3 offset = Vector3Subtract(camera.position, camera.target);
    float radius = Vector3Length(offset);
    if (radius <= 1e-5f) {
        return;
    }

    float yaw = std::atan2(offset.z, offset.x) - delta.x * ORBIT_SPEED;
    float pitch = std::asin(offset.y / radius) + delta.y * ORBIT_SPEED;
    // Stay above the floor so the grid is never seen from below
    pitch = std::clamp(pitch, 0.05f, PITCH_LIMIT);

    float cos_pitch = std::cos(pitch);
    Vector3 rotated{radius * cos_pitch * std::cos(yaw), radius * std::sin(pitch),
                    radius * cos_pitch * std::sin(yaw)};
    camera.position = Vector3Add(camera.target, rotated);
}

void pan(Camera3D& camera, Vector2 delta) {
    Vector3 forward = Vector3Normalize(Vector3Subtract(camera.target, camera.position));
    Vector3 right = Vector3Normalize(Vector3CrossProduct(forward, camera.up));
    Vector3 up = Vector3Normalize(camera.up);
    float scale = PAN_SPEED * std::max(0.1f, Vector3Distance(camera.position, camera.target));

    Vector3 shift =
        Vector3Add(Vector3Scale(right, -delta.x * scale), Vector3Scale(up, delta.y * scale));
    camera.position = Vector3Add(camera.position, shift);
    camera.target = Vector3Add(camera.target, shift);
}

void zoom(Camera3D& camera, float amount) {
    Vector3 view = Vector3Subtract(camera.position, camera.target);
    float distance = std::max(Vector3Length(view), 1e-5f);
    distance = std::clamp(distance * (1.0f + amount * ZOOM_SPEED), MIN_DISTANCE, MAX_DISTANCE);
    camera.position = Vector3Add(camera.target, Vector3Scale(Vector3Normalize(view), distance));
}

} // namespace

CameraRig make_camera_rig() {
    CameraRig rig;
    rig.camera.position = {14.0f, 12.0f, 14.0f};
    rig.camera.target = {0.0f, 0.0f, 0.0f};
    rig.camera.up = {0.0f, 1.0f, 0.0f};
    rig.camera.fovy = 45.0f;
    rig.camera.projection = CAMERA_PERSPECTIVE;
    return rig;
}

void update_camera_rig(CameraRig& rig, bool mouse_in_viewport) {
    if (rig.drag == CameraDrag::NONE && mouse_in_viewport) {
        if (IsMouseButtonPressed(MOUSE_BUTTON_RIGHT)) {
            rig.drag = CameraDrag::ORBIT;
        } else if (IsMouseButtonPressed(MOUSE_BUTTON_MIDDLE)) {
            rig.drag = CameraDrag::PAN;
        }
    }

    Vector2 delta = GetMouseDelta();
    if (rig.drag == CameraDrag::ORBIT) {
        orbit(rig.camera, delta);
        if (IsMouseButtonReleased(MOUSE_BUTTON_RIGHT)) {
            rig.drag = CameraDrag::NONE;
        }
    } else if (rig.drag == CameraDrag::PAN) {
        pan(rig.camera, delta);
        if (IsMouseButtonReleased(MOUSE_BUTTON_MIDDLE)) {
            rig.drag = CameraDrag::NONE;
        }
    }

    if (mouse_in_viewport && rig.drag == CameraDrag::NONE) {
        float wheel = GetMouseWheelMove();
        if (std::fabs(wheel) > 0.0f) {
            zoom(rig.camera, -wheel);
        }
    }
}

GridRay pick_ray(const Camera3D& camera) {
    Ray ray = GetMouseRay(GetMousePosition(), camera);
    GridRay out;
    out.origin = {ray.position.x, ray.position.y, ray.position.z};
    out.direction = {ray.direction.x, ray.direction.y, ray.direction.z};
    return out;
}

std::optional<GridPosition> pick_ground_cell(const Camera3D& camera) {
    Ray ray = GetMouseRay(GetMousePosition(), camera);
    if (std::fabs(ray.direction.y) <= 1e-6f) {
        return std::nullopt;
    }
    float t = (GROUND_PLANE_Y - ray.position.y) / ray.direction.y;
    if (t < 0.0f) {
        return std::nullopt;
    }
    float hit_x = ray.position.x + ray.direction.x * t;
    float hit_z = ray.position.z + ray.direction.z * t;
    return GridPosition{static_cast<int>(std::lround(hit_x)), 0,
                        static_cast<int>(std::lround(hit_z))};
}

} // namespace framekit
