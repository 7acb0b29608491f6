/// @file catalog.cpp
/// @brief Built-in part catalog generation and custom part registration

#include "catalog/catalog.hpp"

#include "catalog/connector_configs.hpp"
#include "geometry/grid_transform.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace framekit {

namespace {

constexpr int BASE_UNIT_MM = 15; // Physical length of one grid unit

PartDefinition make_connector(const ConnectorConfig& config, bool foot,
                              std::optional<Axis> pull_through) {
    PartDefinition def;
    def.id = "connector-" + std::string(config.id);
    def.name = std::to_string(config.dimensions) + "D " + std::to_string(config.directions) + "-Way";
    def.description = std::to_string(config.dimensions) + "-dimensional " +
                      std::to_string(config.directions) + "-way connector";
    if (foot) {
        def.id += "-foot";
        def.name += " Foot";
        def.description += " foot";
    }
    if (pull_through) {
        std::string axis(axis_name(*pull_through));
        def.id += "-pt-" + axis;
        def.name += " PT-" + std::string(1, static_cast<char>(axis[0] - 'a' + 'A'));
        def.description += " with " + axis + " pull-through";
    }
    def.category = PartCategory::CONNECTOR;
    def.grid_cells = {{0, 0, 0}};
    def.pull_through_axis = pull_through;
    for (Direction dir : arm_directions(config)) {
        def.connection_points.push_back({{0, 0, 0}, dir, ConnectionRole::FEMALE});
    }
    return def;
}

bool has_arm_on_axis(const ConnectorConfig& config, Axis axis) {
    for (Direction dir : arm_directions(config)) {
        if (direction_axis(dir) == axis) {
            return true;
        }
    }
    return false;
}

} // namespace

PartDefinition make_support(int units) {
    if (units < 1) {
        throw std::invalid_argument("Support length must be at least 1 unit");
    }
    PartDefinition def;
    def.id = "support-" + std::to_string(units) + "u";
    def.category = PartCategory::SUPPORT;
    def.name = "Support (" + std::to_string(units) + "u)";
    def.description = std::to_string(units * BASE_UNIT_MM) + "mm support beam (" +
                      std::to_string(units) + (units > 1 ? " units)" : " unit)");
    for (int i = 0; i < units; i++) {
        def.grid_cells.push_back({0, i, 0});
    }
    def.connection_points = {
        {{0, 0, 0}, Direction::NEG_Y, ConnectionRole::MALE},
        {{0, units - 1, 0}, Direction::POS_Y, ConnectionRole::MALE},
    };
    return def;
}

PartDefinition make_box_part(std::string id, std::string name, int size_x, int size_y,
                             int size_z) {
    PartDefinition def;
    def.id = std::move(id);
    def.name = std::move(name);
    def.category = PartCategory::CUSTOM;
    def.description = "Imported custom part";
    int nx = std::max(1, size_x);
    int ny = std::max(1, size_y);
    int nz = std::max(1, size_z);
    for (int x = 0; x < nx; x++) {
        for (int y = 0; y < ny; y++) {
            for (int z = 0; z < nz; z++) {
                def.grid_cells.push_back({x, y, z});
            }
        }
    }
    return def;
}

Catalog Catalog::builtin() {
    Catalog catalog;

    for (int units = 1; units <= MAX_SUPPORT_UNITS; units++) {
        catalog.insert(make_support(units));
    }

    for (const ConnectorConfig& config : connector_configs()) {
        catalog.insert(make_connector(config, false, std::nullopt));
    }

    // A foot replaces the downward arm, so only layouts without -y get one
    for (const ConnectorConfig& config : connector_configs()) {
        std::vector<Direction> arms = arm_directions(config);
        if (std::find(arms.begin(), arms.end(), Direction::NEG_Y) == arms.end()) {
            catalog.insert(make_connector(config, true, std::nullopt));
        }
    }

    // Pull-through tunnels run along an axis no arm occupies
    for (const ConnectorConfig& config : connector_configs()) {
        for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
            if (!has_arm_on_axis(config, axis)) {
                catalog.insert(make_connector(config, false, axis));
            }
        }
    }

    PartDefinition lockpin;
    lockpin.id = std::string(DEFAULT_LOCKPIN_ID);
    lockpin.category = PartCategory::LOCKPIN;
    lockpin.name = "Lock Pin";
    lockpin.description = "Standard 4mm square lock pin with grip";
    lockpin.grid_cells = {{0, 0, 0}};
    catalog.insert(std::move(lockpin));

    return catalog;
}

const PartDefinition* Catalog::find(std::string_view id) const {
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<const PartDefinition*> Catalog::definitions_in(PartCategory category) const {
    std::vector<const PartDefinition*> result;
    for (const PartDefinition* def : order_) {
        if (def->category == category) {
            result.push_back(def);
        }
    }
    return result;
}

const PartDefinition& Catalog::add_custom_part(PartDefinition def) {
    if (def.category != PartCategory::CUSTOM) {
        throw std::invalid_argument("add_custom_part() requires a CUSTOM definition");
    }
    if (def.grid_cells.empty()) {
        throw std::invalid_argument("Custom part '" + def.id + "' occupies no cells");
    }
    if (contains(def.id)) {
        throw std::invalid_argument("Part id '" + def.id + "' is already registered");
    }
    return insert(std::move(def));
}

const PartDefinition& Catalog::insert(PartDefinition def) {
    auto owned = std::make_unique<PartDefinition>(std::move(def));
    const PartDefinition* ptr = owned.get();
    by_id_[ptr->id] = std::move(owned);
    order_.push_back(ptr);
    return *ptr;
}

} // namespace framekit
