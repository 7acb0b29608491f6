/// @file connector_configs.cpp
/// @brief Connector arm layout table

#include "catalog/connector_configs.hpp"

namespace framekit {

namespace {

constexpr std::array<Direction, 6> ARM_ORDER = {Direction::POS_Y, Direction::NEG_Y,
                                                Direction::POS_X, Direction::NEG_X,
                                                Direction::POS_Z, Direction::NEG_Z};

} // namespace

const std::vector<ConnectorConfig>& connector_configs() {
    //                                      +y     -y     +x     -x     +z     -z
    static const std::vector<ConnectorConfig> configs = {
        {"1d1w", 1, 1, {true, false, false, false, false, false}},
        {"1d2w", 1, 2, {true, true, false, false, false, false}},
        {"2d2w", 2, 2, {true, false, true, false, false, false}},
        {"2d3w", 2, 3, {true, true, true, false, false, false}},
        {"2d4w", 2, 4, {true, true, true, true, false, false}},
        {"3d3w", 3, 3, {true, false, true, false, true, false}},
        {"3d4w", 3, 4, {true, true, true, false, true, false}},
        {"3d5w", 3, 5, {true, true, true, true, true, false}},
        {"3d6w", 3, 6, {true, true, true, true, true, true}},
    };
    return configs;
}

const ConnectorConfig* find_connector_config(std::string_view id) {
    for (const ConnectorConfig& config : connector_configs()) {
        if (config.id == id) {
            return &config;
        }
    }
    return nullptr;
}

std::vector<Direction> arm_directions(const ConnectorConfig& config) {
    std::vector<Direction> dirs;
    for (size_t i = 0; i < ARM_ORDER.size(); i++) {
        if (config.arms[i]) {
            dirs.push_back(ARM_ORDER[i]);
        }
    }
    return dirs;
}

} // namespace framekit
