#pragma once

/// @file bom.hpp
/// @brief Bill of materials derived from an assembly

#include "assembly/assembly.hpp"
#include "catalog/part_definition.hpp"

#include <string>
#include <vector>

namespace framekit {

struct BomEntry {
    std::string definition_id;
    std::string name;
    PartCategory category = PartCategory::CUSTOM;
    int quantity = 0;
};

/// Lock pins to order for a number of pinned joints: ceil(joints * 1.1)
[[nodiscard]] int lockpins_with_spare(int joints);

/// Connector arms whose neighbouring cell holds a support
[[nodiscard]] int count_pinned_joints(const Assembly& assembly);

/// One entry per definition in use, plus an automatic lock pin line when
/// any support is seated in a connector. Sorted by category name, then by
/// part name.
[[nodiscard]] std::vector<BomEntry> get_bom(const Assembly& assembly);

} // namespace framekit
