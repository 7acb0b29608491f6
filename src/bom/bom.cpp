/// @file bom.cpp
/// @brief Part counting and lock pin derivation

#include "bom/bom.hpp"

#include "geometry/grid_transform.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace framekit {

int lockpins_with_spare(int joints) {
    return (joints * 11 + 9) / 10;
}

int count_pinned_joints(const Assembly& assembly) {
    const Catalog& catalog = assembly.catalog();
    int joints = 0;
    for (const PlacedPart& part : assembly.get_all_parts()) {
        const PartDefinition* def = catalog.find(part.definition_id);
        if (def == nullptr || !def->is_connector()) {
            continue;
        }
        Axis orient = part.effective_orientation();
        for (const ConnectionPoint& cp : def->connection_points) {
            GridPosition socket = part.position + place_cell(cp.offset, part.rotation, orient);
            GridPosition neighbour =
                adjacent(socket, place_direction(cp.direction, part.rotation, orient));
            const PlacedPart* seated = assembly.get_part_at(neighbour);
            if (seated == nullptr) {
                continue;
            }
            const PartDefinition* seated_def = catalog.find(seated->definition_id);
            if (seated_def != nullptr && seated_def->is_support()) {
                joints++;
            }
        }
    }
    return joints;
}

std::vector<BomEntry> get_bom(const Assembly& assembly) {
    const Catalog& catalog = assembly.catalog();

    std::map<std::string, int> counts;
    for (const PlacedPart& part : assembly.get_all_parts()) {
        counts[part.definition_id]++;
    }

    std::vector<BomEntry> bom;
    bom.reserve(counts.size() + 1);
    for (const auto& [id, quantity] : counts) {
        const PartDefinition* def = catalog.find(id);
        if (def == nullptr) {
            continue;
        }
        bom.push_back({def->id, def->name, def->category, quantity});
    }

    int joints = count_pinned_joints(assembly);
    if (joints > 0) {
        BomEntry pins;
        pins.definition_id = std::string(DEFAULT_LOCKPIN_ID);
        pins.name = "Lock Pin (auto: " + std::to_string(joints) + " + spare)";
        pins.category = PartCategory::LOCKPIN;
        pins.quantity = lockpins_with_spare(joints);
        bom.push_back(std::move(pins));
    }

    std::sort(bom.begin(), bom.end(), [](const BomEntry& a, const BomEntry& b) {
        std::string_view ca = category_name(a.category);
        std::string_view cb = category_name(b.category);
        if (ca != cb) {
            return ca < cb;
        }
        return a.name < b.name;
    });
    return bom;
}

} // namespace framekit
