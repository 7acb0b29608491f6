/// @file assembly.cpp
/// @brief Placement validation, occupancy bookkeeping and persistence replay

#include "assembly/assembly.hpp"

#include "geometry/grid_transform.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace framekit {

namespace {

const std::vector<CellOccupant> NO_OCCUPANTS;

} // namespace

CellClaim claim_for(const PartDefinition& def, const Rotation& /*rotation*/, Axis orientation) {
    // Beams claim their orientation axis; rotation only moves the cells
    if (def.is_support()) {
        return CellClaim::beam(orientation);
    }
    return CellClaim::whole_cell();
}

std::optional<Axis> effective_pull_through_axis(const PartDefinition& def,
                                                const Rotation& rotation) {
    if (!def.pull_through_axis) {
        return std::nullopt;
    }
    return rotate_axis(*def.pull_through_axis, rotation);
}

bool has_arm_below_ground(const PartDefinition& def, const GridPosition& position,
                          const Rotation& rotation, Axis orientation) {
    for (const ConnectionPoint& cp : def.connection_points) {
        GridPosition socket = position + place_cell(cp.offset, rotation, orientation);
        GridPosition arm = adjacent(socket, place_direction(cp.direction, rotation, orientation));
        if (arm.y < 0) {
            return true;
        }
    }
    return false;
}

Assembly::Assembly(const Catalog& catalog) : catalog_(&catalog) {}

bool Assembly::is_occupied(const GridPosition& pos) const {
    auto it = occupancy_.find(pos);
    return it != occupancy_.end() && !it->second.empty();
}

const PlacedPart* Assembly::get_part_at(const GridPosition& pos) const {
    auto it = occupancy_.find(pos);
    if (it == occupancy_.end() || it->second.empty()) {
        return nullptr;
    }
    return get_part_by_id(it->second.front().owner);
}

const std::vector<CellOccupant>& Assembly::occupants_at(const GridPosition& pos) const {
    auto it = occupancy_.find(pos);
    if (it == occupancy_.end()) {
        return NO_OCCUPANTS;
    }
    return it->second;
}

bool Assembly::is_cell_free_for_beam_axis(const GridPosition& pos, Axis axis) const {
    return is_cell_free(pos, CellClaim::beam(axis), std::nullopt, std::nullopt);
}

bool Assembly::is_custom_part(PartId id) const {
    const PlacedPart* part = get_part_by_id(id);
    if (part == nullptr) {
        return false;
    }
    const PartDefinition* def = catalog_->find(part->definition_id);
    return def != nullptr && def->category == PartCategory::CUSTOM;
}

bool Assembly::is_cell_free(const GridPosition& pos, const CellClaim& claim,
                            std::optional<Axis> pull_through,
                            std::optional<PartId> ignore_id) const {
    for (const CellOccupant& occ : occupants_at(pos)) {
        if (ignore_id && occ.owner == *ignore_id) {
            continue;
        }
        if (settings_.custom_parts_skip_collision && is_custom_part(occ.owner)) {
            continue;
        }
        if (!can_coexist(occ, claim, pull_through)) {
            return false;
        }
    }
    return true;
}

bool Assembly::validate(const PartDefinition& def, const GridPosition& position,
                        const Rotation& rotation, Axis orientation,
                        std::optional<PartId> ignore_id) const {
    if (settings_.custom_parts_skip_collision && def.category == PartCategory::CUSTOM) {
        return true;
    }

    // Connector arms reach into the neighbouring cell and must stay above ground
    if (def.is_connector() && has_arm_below_ground(def, position, rotation, orientation)) {
        return false;
    }

    CellClaim claim = claim_for(def, rotation, orientation);
    std::optional<Axis> pull_through = effective_pull_through_axis(def, rotation);

    for (const GridPosition& cell : world_cells(def, position, rotation, orientation)) {
        if (cell.y < 0) {
            return false;
        }
        if (!is_cell_free(cell, claim, pull_through, ignore_id)) {
            return false;
        }
    }
    return true;
}

bool Assembly::can_place(std::string_view definition_id, const GridPosition& position,
                         const Rotation& rotation, std::optional<Axis> orientation) const {
    const PartDefinition* def = catalog_->find(definition_id);
    if (def == nullptr) {
        return false;
    }
    return validate(*def, position, rotation, orientation.value_or(Axis::Y), std::nullopt);
}

bool Assembly::can_place_ignoring(std::string_view definition_id, const GridPosition& position,
                                  const Rotation& rotation, PartId ignore_id,
                                  std::optional<Axis> orientation) const {
    const PartDefinition* def = catalog_->find(definition_id);
    if (def == nullptr) {
        return false;
    }
    return validate(*def, position, rotation, orientation.value_or(Axis::Y), ignore_id);
}

const PlacedPart* Assembly::get_part_by_id(PartId id) const {
    auto it = parts_.find(id);
    if (it == parts_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<PlacedPart> Assembly::get_all_parts() const {
    std::vector<PlacedPart> result;
    result.reserve(parts_.size());
    for (const auto& [id, part] : parts_) {
        result.push_back(part);
    }
    return result;
}

std::optional<PartId> Assembly::add_part(std::string_view definition_id,
                                         const GridPosition& position, const Rotation& rotation,
                                         std::optional<Axis> orientation,
                                         std::optional<std::string> color) {
    const PartDefinition* def = catalog_->find(definition_id);
    if (def == nullptr) {
        return std::nullopt;
    }
    Axis effective = orientation.value_or(Axis::Y);
    if (!validate(*def, position, rotation, effective, std::nullopt)) {
        return std::nullopt;
    }

    PartId id = next_part_id_++;
    PlacedPart part;
    part.id = id;
    part.definition_id = def->id;
    part.position = position;
    part.rotation = rotation;
    part.orientation = orientation;
    part.color = std::move(color);
    parts_.emplace(id, std::move(part));

    CellClaim claim = claim_for(*def, rotation, effective);
    std::optional<Axis> pull_through = effective_pull_through_axis(*def, rotation);
    for (const GridPosition& cell : world_cells(*def, position, rotation, effective)) {
        occupancy_[cell].push_back({id, claim, pull_through});
    }

    notify();
    return id;
}

std::optional<PlacedPart> Assembly::remove_part(PartId id) {
    auto it = parts_.find(id);
    if (it == parts_.end()) {
        return std::nullopt;
    }
    PlacedPart removed = std::move(it->second);
    parts_.erase(it);

    if (const PartDefinition* def = catalog_->find(removed.definition_id); def != nullptr) {
        for (const GridPosition& cell : world_cells(*def, removed.position, removed.rotation,
                                                    removed.effective_orientation())) {
            auto cell_it = occupancy_.find(cell);
            if (cell_it == occupancy_.end()) {
                continue;
            }
            auto& occupants = cell_it->second;
            occupants.erase(std::remove_if(occupants.begin(), occupants.end(),
                                           [id](const CellOccupant& o) { return o.owner == id; }),
                            occupants.end());
            if (occupants.empty()) {
                occupancy_.erase(cell_it);
            }
        }
    }

    notify();
    return removed;
}

void Assembly::clear() {
    parts_.clear();
    occupancy_.clear();
    notify();
}

bool Assembly::set_part_color(PartId id, std::optional<std::string> color) {
    auto it = parts_.find(id);
    if (it == parts_.end()) {
        return false;
    }
    PlacedPart updated = it->second;
    updated.color = std::move(color);
    it->second = std::move(updated);
    notify();
    return true;
}

void Assembly::set_settings(const AssemblySettings& settings) {
    settings_ = settings;
    notify();
}

AssemblyFile Assembly::serialize(const std::string& name) const {
    AssemblyFile file;
    file.name = name;
    file.parts.reserve(parts_.size());
    for (const auto& [id, part] : parts_) {
        AssemblyFileEntry entry;
        entry.type = part.definition_id;
        entry.position = part.position;
        entry.rotation = part.rotation;
        entry.orientation = part.orientation;
        entry.color = part.color;
        file.parts.push_back(std::move(entry));
    }
    return file;
}

size_t Assembly::deserialize(const AssemblyFile& file) {
    clear();
    size_t restored = 0;
    for (const AssemblyFileEntry& entry : file.parts) {
        // Older saves stored a single number: a rotation about Y only
        Rotation rotation = entry.rotation;
        if (entry.legacy_rotation) {
            if (*entry.legacy_rotation % 90 != 0) {
                std::fprintf(stderr,
                             "[framekit] Skipped '%s' at [%d,%d,%d] while loading '%s': "
                             "rotation %d is not a quarter turn.\n",
                             entry.type.c_str(), entry.position.x, entry.position.y,
                             entry.position.z, file.name.c_str(), *entry.legacy_rotation);
                continue;
            }
            rotation = Rotation::from_degrees(0, *entry.legacy_rotation, 0);
        }
        if (add_part(entry.type, entry.position, rotation, entry.orientation, entry.color)) {
            restored++;
        } else {
            std::fprintf(stderr, "[framekit] Skipped '%s' at [%d,%d,%d] while loading '%s'.\n",
                         entry.type.c_str(), entry.position.x, entry.position.y,
                         entry.position.z, file.name.c_str());
        }
    }
    return restored;
}

SubscriptionId Assembly::subscribe(ChangeListener listener) {
    SubscriptionId id = next_subscription_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void Assembly::unsubscribe(SubscriptionId id) {
    listeners_.erase(id);
}

void Assembly::notify() {
    // Copy so listeners may (un)subscribe while being notified
    std::vector<ChangeListener> snapshot;
    snapshot.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) {
        snapshot.push_back(listener);
    }
    for (const ChangeListener& listener : snapshot) {
        listener();
    }
}

} // namespace framekit
