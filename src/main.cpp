/// @file main.cpp
/// @brief Framekit entry point — interactive modular frame designer
///
/// Places supports, connectors and lock pins on a 3D grid with snapping and
/// auto-rotation, shows the live bill of materials, and saves/loads the
/// assembly as JSON. Supports both native desktop and Emscripten/WASM builds.

#include "assembly/assembly.hpp"
#include "assembly/assembly_file.hpp"
#include "bom/bom.hpp"
#include "catalog/catalog.hpp"
#include "geometry/grid_transform.hpp"
#include "rendering/camera_rig.hpp"
#include "rendering/scene_renderer.hpp"
#include "snap/snap_engine.hpp"
#include "ui/bom_panel.hpp"
#include "ui/palette_panel.hpp"
#include "ui/ui_scale.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <array>
#include <cstdio>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 900;
constexpr int MIN_HEIGHT = 500;
constexpr int TARGET_FPS = 60;
constexpr int FLOOR_HALF_EXTENT = 12;

constexpr const char* ASSEMBLY_PATH = "framekit_assembly.json";
constexpr const char* SETTINGS_PATH = "framekit_settings.json";
constexpr const char* ASSEMBLY_NAME = "My Rack";

/// Colours cycled by the P key; the last slot resets to the category colour
constexpr std::array<const char*, 5> PART_COLORS = {"#d94c4c", "#4cb35a", "#4c7fd9", "#e0b040",
                                                    nullptr};

/// Model + derived view state. The assembly references the catalog, so both
/// live here and are never moved once the assembly exists.
struct AppState {
    framekit::Catalog catalog = framekit::Catalog::builtin();
    std::unique_ptr<framekit::Assembly> assembly;
    framekit::SubscriptionId subscription = 0;

    std::vector<framekit::BomEntry> bom;
    bool bom_dirty = true;

    framekit::CameraRig rig = framekit::make_camera_rig();
    framekit::Ghost ghost;
    framekit::PartId hovered = 0;
};

/// All mutable state needed by the frame loop, bundled so it can be passed
/// through Emscripten's void* callback.
struct FrameState {
    framekit::UIState ui;
    AppState app;
};

std::optional<std::string> read_text_file(const char* path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool write_text_file(const char* path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }
    out << text;
    return static_cast<bool>(out);
}

void save_settings(const framekit::AssemblySettings& settings) {
    if (!write_text_file(SETTINGS_PATH, framekit::settings_to_json(settings))) {
        std::fprintf(stderr, "[framekit] Could not write settings to %s.\n", SETTINGS_PATH);
    }
}

/// Loads persisted settings into the model and mirrors them in the UI.
void load_settings(AppState& app, framekit::UIState& ui) {
    auto text = read_text_file(SETTINGS_PATH);
    if (!text) {
        return;
    }
    try {
        framekit::AssemblySettings settings = framekit::parse_settings(*text);
        app.assembly->set_settings(settings);
        ui.snap_enabled = settings.snap_enabled;
        ui.custom_skip_collision = settings.custom_parts_skip_collision;
    } catch (const framekit::AssemblyFileError& e) {
        std::fprintf(stderr, "[framekit] Ignoring %s: %s\n", SETTINGS_PATH, e.what());
    }
}

void save_assembly(const AppState& app, framekit::UIState& ui) {
    std::string json = framekit::assembly_file_to_json(app.assembly->serialize(ASSEMBLY_NAME));
    if (!write_text_file(ASSEMBLY_PATH, json)) {
        std::fprintf(stderr, "[framekit] Could not write %s.\n", ASSEMBLY_PATH);
        ui.status = "Save failed";
        return;
    }
    std::fprintf(stderr, "[framekit] Saved %zu parts to %s.\n", app.assembly->part_count(),
                 ASSEMBLY_PATH);
    ui.status = "Saved " + std::to_string(app.assembly->part_count()) + " parts";
}

void load_assembly(AppState& app, framekit::UIState& ui) {
    auto text = read_text_file(ASSEMBLY_PATH);
    if (!text) {
        std::fprintf(stderr, "[framekit] Nothing to load: %s not found.\n", ASSEMBLY_PATH);
        ui.status = "No saved assembly";
        return;
    }
    try {
        framekit::AssemblyFile file = framekit::parse_assembly_file(*text);
        size_t restored = app.assembly->deserialize(file);
        std::fprintf(stderr, "[framekit] Loaded %zu of %zu parts from %s.\n", restored,
                     file.parts.size(), ASSEMBLY_PATH);
        ui.status = "Loaded " + std::to_string(restored) + " of " +
                    std::to_string(file.parts.size()) + " parts";
    } catch (const framekit::AssemblyFileError& e) {
        std::fprintf(stderr, "[framekit] Could not load %s: %s\n", ASSEMBLY_PATH, e.what());
        ui.status = "Load failed (see log)";
    }
}

/// Builds the model, hooks BOM invalidation and restores persisted settings.
void init_app_state(AppState& app, framekit::UIState& ui) {
    // One sample custom part so the overlap toggle has something to act on
    app.catalog.add_custom_part(framekit::make_box_part("custom-box-2x2x2", "Box 2x2x2", 2, 2, 2));

    app.assembly = std::make_unique<framekit::Assembly>(app.catalog);
    AppState* self = &app;
    app.subscription = app.assembly->subscribe([self]() { self->bom_dirty = true; });
    load_settings(app, ui);
}

/// Placed part whose cells the mouse ray hits first, or 0
framekit::PartId pick_part(const framekit::Assembly& assembly, const Camera3D& camera) {
    Ray ray = GetMouseRay(GetMousePosition(), camera);
    framekit::PartId best = 0;
    float best_distance = std::numeric_limits<float>::max();
    for (const framekit::PlacedPart& part : assembly.get_all_parts()) {
        const framekit::PartDefinition* def = assembly.catalog().find(part.definition_id);
        if (def == nullptr) {
            continue;
        }
        for (const framekit::GridPosition& cell :
             framekit::world_cells(*def, part.position, part.rotation,
                                   part.effective_orientation())) {
            Vector3 c = {static_cast<float>(cell.x), static_cast<float>(cell.y),
                         static_cast<float>(cell.z)};
            BoundingBox box = {{c.x - 0.5f, c.y - 0.5f, c.z - 0.5f},
                               {c.x + 0.5f, c.y + 0.5f, c.z + 0.5f}};
            RayCollision hit = GetRayCollisionBox(ray, box);
            if (hit.hit && hit.distance < best_distance) {
                best_distance = hit.distance;
                best = part.id;
            }
        }
    }
    return best;
}

/// Resolves where the selected part would go this frame: snapped onto a
/// socket or support end when possible, else lifted onto the floor cell.
void update_ghost(AppState& app, const framekit::UIState& ui, bool mouse_in_viewport) {
    framekit::Ghost& ghost = app.ghost;
    ghost = {};
    ghost.definition = framekit::selected_definition(app.catalog, ui);
    if (ghost.definition == nullptr || !mouse_in_viewport) {
        ghost.definition = nullptr;
        return;
    }

    auto cursor = framekit::pick_ground_cell(app.rig.camera);
    if (!cursor) {
        ghost.definition = nullptr;
        return;
    }
    framekit::GridRay ray = framekit::pick_ray(app.rig.camera);
    const framekit::Assembly& assembly = *app.assembly;
    const std::string& id = ghost.definition->id;

    ghost.rotation = ui.rotation;
    ghost.orientation = ghost.definition->is_support() ? ui.orientation : framekit::Axis::Y;

    if (assembly.settings().snap_enabled) {
        if (ghost.definition->is_support()) {
            if (auto snap = framekit::find_best_snap(assembly, id, *cursor,
                                                     framekit::DEFAULT_SNAP_RADIUS, ray)) {
                ghost.position = snap->position;
                ghost.rotation = {};
                ghost.orientation = snap->orientation;
                ghost.snapped = true;
            }
        } else if (ghost.definition->is_connector()) {
            if (auto snap = framekit::find_best_connector_snap(
                    assembly, id, *cursor, framekit::DEFAULT_SNAP_RADIUS, ray, ui.rotation)) {
                ghost.position = snap->position;
                ghost.rotation = snap->auto_rotation.value_or(ui.rotation);
                ghost.snapped = true;
            }
        }
    }

    if (!ghost.snapped) {
        ghost.position = *cursor;
        ghost.position.y +=
            framekit::compute_ground_lift(*ghost.definition, ghost.rotation, ghost.orientation);
    }

    std::optional<framekit::Axis> orientation;
    if (ghost.definition->is_support()) {
        orientation = ghost.orientation;
    }
    ghost.valid = assembly.can_place(id, ghost.position, ghost.rotation, orientation);
}

void place_ghost(AppState& app, framekit::UIState& ui) {
    const framekit::Ghost& ghost = app.ghost;
    if (ghost.definition == nullptr) {
        return;
    }
    std::optional<framekit::Axis> orientation;
    if (ghost.definition->is_support()) {
        orientation = ghost.orientation;
    }
    auto id = app.assembly->add_part(ghost.definition->id, ghost.position, ghost.rotation,
                                     orientation);
    ui.status = id ? "Placed " + ghost.definition->name : "Cannot place here";
}

void cycle_part_color(AppState& app) {
    const framekit::PlacedPart* part = app.assembly->get_part_by_id(app.hovered);
    if (part == nullptr) {
        return;
    }
    size_t next = 0;
    for (size_t i = 0; i + 1 < PART_COLORS.size(); i++) {
        if (part->color && *part->color == PART_COLORS[i]) {
            next = i + 1;
            break;
        }
    }
    std::optional<std::string> color;
    if (PART_COLORS[next] != nullptr) {
        color = PART_COLORS[next];
    }
    app.assembly->set_part_color(app.hovered, color);
}

void draw_hud(const AppState& app, const framekit::UIState& ui, int screen_h) {
    const auto& s = framekit::ui_scale();
    int y = screen_h - static_cast<int>(3.0f * s.hud_line) - 6;

    DrawText(ui.status.c_str(), 10, y, s.hud_font, {220, 220, 230, 255});
    y += static_cast<int>(s.hud_line);

    if (app.ghost.definition != nullptr) {
        char where[96];
        std::snprintf(where, sizeof(where), "[%d, %d, %d]%s", app.ghost.position.x,
                      app.ghost.position.y, app.ghost.position.z,
                      app.ghost.snapped ? "  snapped" : "");
        DrawText(where, 10, y, s.hud_font, {140, 140, 140, 255});
    }
    y += static_cast<int>(s.hud_line);

    DrawText("LMB place  RMB orbit  MMB pan  R rotate  O orient  P colour  Del remove", 10, y,
             s.hud_font, {110, 110, 120, 255});
}

/// One frame of the application — called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(FrameState& state) {
    auto& ui = state.ui;
    auto& app = state.app;

    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    framekit::update_ui_scale(screen_w, screen_h);
    const auto& s = framekit::ui_scale();

    float panel_x = static_cast<float>(screen_w) - s.panel_w - s.margin;
    bool mouse_in_viewport = GetMousePosition().x < panel_x - s.margin;

    framekit::update_camera_rig(app.rig, mouse_in_viewport);
    app.hovered = mouse_in_viewport ? pick_part(*app.assembly, app.rig.camera) : 0;
    update_ghost(app, ui, mouse_in_viewport);

    // --- Keyboard shortcuts ---
    bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
    if (ctrl && IsKeyPressed(KEY_S)) {
        save_assembly(app, ui);
    } else if (ctrl && IsKeyPressed(KEY_L)) {
        load_assembly(app, ui);
    } else {
        if (IsKeyPressed(KEY_R)) {
            ui.rotation.y = (ui.rotation.y + 90) % 360;
        }
        if (IsKeyPressed(KEY_O)) {
            ui.orientation = framekit::next_orientation(ui.orientation);
        }
        if (IsKeyPressed(KEY_P)) {
            cycle_part_color(app);
        }
        if ((IsKeyPressed(KEY_DELETE) || IsKeyPressed(KEY_BACKSPACE)) && app.hovered != 0) {
            if (auto removed = app.assembly->remove_part(app.hovered)) {
                ui.status = "Removed " + removed->definition_id;
            }
            app.hovered = 0;
        }
    }

    if (mouse_in_viewport && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        place_ghost(app, ui);
    }

    if (app.bom_dirty) {
        app.bom = framekit::get_bom(*app.assembly);
        app.bom_dirty = false;
    }

    // --- Draw ---
    BeginDrawing();
    ClearBackground({25, 25, 30, 255});

    BeginMode3D(app.rig.camera);
    framekit::draw_floor(FLOOR_HALF_EXTENT);
    framekit::draw_assembly(*app.assembly, app.hovered);
    framekit::draw_ghost(app.ghost);
    EndMode3D();

    // --- Right-side UI panels ---
    framekit::PalettePanelResult palette =
        framekit::draw_palette_panel(ui, app.catalog, panel_x, s.margin, s.panel_w);
    float bom_y = s.margin + palette.panel_height + s.margin;
    framekit::draw_bom_panel(app.bom, panel_x, bom_y, s.panel_w,
                             static_cast<float>(screen_h) - bom_y - s.margin);

    draw_hud(app, ui, screen_h);

    EndDrawing();

    // --- Process UI actions (take effect next frame) ---
    const framekit::PaletteAction& action = palette.action;
    if (action.snap_toggled || action.collision_toggled) {
        framekit::AssemblySettings settings = app.assembly->settings();
        settings.snap_enabled = ui.snap_enabled;
        settings.custom_parts_skip_collision = ui.custom_skip_collision;
        app.assembly->set_settings(settings);
        save_settings(settings);
    }
    if (action.save_pressed) {
        save_assembly(app, ui);
    }
    if (action.load_pressed) {
        load_assembly(app, ui);
    }
    if (action.clear_pressed) {
        app.assembly->clear();
        ui.status = "Cleared";
    }
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback — unwraps the void* to FrameState.
void emscripten_frame(void* arg) {
    auto* state = static_cast<FrameState*>(arg);
    frame_tick(*state);
}
#endif

} // namespace

int main() {
    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Framekit — Modular Frame Designer");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetExitKey(KEY_NULL); // Esc should not close the designer mid-build
    SetTargetFPS(TARGET_FPS);

    // --- Create all mutable state ---
    auto state = std::make_unique<FrameState>();
    init_app_state(state->app, state->ui);

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop — we pass state via void*.
    emscripten_set_main_loop_arg(emscripten_frame, state.get(), 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(*state);
    }
#endif

    state->app.assembly->unsubscribe(state->app.subscription);
    CloseWindow();
    return 0;
}
