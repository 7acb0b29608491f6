#pragma once

/// @file connector_configs.hpp
/// @brief Arm layouts of the multi-way connectors

#include "geometry/grid_types.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace framekit {

/// One connector arm layout, e.g. "3d4w" = spans 3 axes with 4 arms.
/// arms[] is indexed in the order +y, -y, +x, -x, +z, -z.
struct ConnectorConfig {
    std::string_view id;
    int dimensions = 0;
    int directions = 0;
    std::array<bool, 6> arms{};
};

/// All known layouts, from 1d1w to 3d6w
[[nodiscard]] const std::vector<ConnectorConfig>& connector_configs();

/// Looks up a layout by id, or nullptr if unknown
[[nodiscard]] const ConnectorConfig* find_connector_config(std::string_view id);

/// Active arm directions of a layout, in +y, -y, +x, -x, +z, -z order
[[nodiscard]] std::vector<Direction> arm_directions(const ConnectorConfig& config);

} // namespace framekit
