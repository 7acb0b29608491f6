#pragma once

/// @file catalog.hpp
/// @brief Part catalog — built-in supports, connectors, lock pins and custom parts

#include "catalog/part_definition.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace framekit {

/// Definition id of the fastener the BOM counts automatically
inline constexpr std::string_view DEFAULT_LOCKPIN_ID = "lockpin-standard";

/// Longest support length in the built-in catalog, in grid units
inline constexpr int MAX_SUPPORT_UNITS = 18;

/// Builds a support of the given length (cells [0,i,0], male ends at -Y and +Y)
[[nodiscard]] PartDefinition make_support(int units);

/// Builds a custom part that fills a size_x * size_y * size_z box of cells.
/// Each size is clamped to at least one cell.
[[nodiscard]] PartDefinition make_box_part(std::string id, std::string name, int size_x,
                                           int size_y, int size_z);

/// Read-only lookup of part definitions by id.
///
/// Definitions are stored behind stable pointers, so a pointer returned by
/// find() stays valid for the lifetime of the catalog.
class Catalog {
  public:
    Catalog() = default;

    // Non-copyable, movable
    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;
    Catalog(Catalog&&) = default;
    Catalog& operator=(Catalog&&) = default;

    /// The full built-in catalog: supports 1u..18u, every connector
    /// configuration with its foot and pull-through variants, and the lock pin.
    [[nodiscard]] static Catalog builtin();

    /// Returns the definition with this id, or nullptr if unknown
    [[nodiscard]] const PartDefinition* find(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

    /// All definitions of one category, in registration order
    [[nodiscard]] std::vector<const PartDefinition*> definitions_in(PartCategory category) const;

    [[nodiscard]] size_t size() const { return order_.size(); }

    /// Registers a user-imported part.
    /// @throws std::invalid_argument if the id is taken, the part has no cells,
    ///         or its category is not CUSTOM
    const PartDefinition& add_custom_part(PartDefinition def);

  private:
    const PartDefinition& insert(PartDefinition def);

    std::unordered_map<std::string, std::unique_ptr<PartDefinition>> by_id_;
    std::vector<const PartDefinition*> order_;
};

} // namespace framekit
