#pragma once

/// @file assembly.hpp
/// @brief Assembly model — owns placed parts and the per-cell occupancy index

#include "assembly/assembly_file.hpp"
#include "assembly/cell_occupant.hpp"
#include "catalog/catalog.hpp"
#include "geometry/grid_types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace framekit {

/// A part instance on the grid. Stored records are never edited in place;
/// moving a part means removing it and adding it again under a new id.
struct PlacedPart {
    PartId id = 0;
    std::string definition_id;
    GridPosition position;
    Rotation rotation;
    std::optional<Axis> orientation; ///< Supports only; absent means Y
    std::optional<std::string> color;

    [[nodiscard]] Axis effective_orientation() const { return orientation.value_or(Axis::Y); }
};

using ChangeListener = std::function<void()>;
using SubscriptionId = uint32_t;

/// The occupancy and placement model.
///
/// Every mutation goes through add_part / remove_part / clear /
/// set_part_color / set_settings / deserialize. Each successful mutation
/// notifies subscribers synchronously, after internal state is consistent.
///
/// Usage:
///   1. Construct over a catalog that outlives the assembly
///   2. Query can_place() while the user hovers
///   3. Commit with add_part(); the returned id identifies the instance
///   4. Read back with get_all_parts() / occupants_at(), or hand the
///      assembly to the snap engine and BOM deriver
class Assembly {
  public:
    explicit Assembly(const Catalog& catalog);

    // Non-copyable (listeners capture state by reference)
    Assembly(const Assembly&) = delete;
    Assembly& operator=(const Assembly&) = delete;

    [[nodiscard]] const Catalog& catalog() const { return *catalog_; }

    // --- Queries ---

    /// True if any part has an occupant entry at pos
    [[nodiscard]] bool is_occupied(const GridPosition& pos) const;

    /// The first part that claimed pos, or nullptr
    [[nodiscard]] const PlacedPart* get_part_at(const GridPosition& pos) const;

    /// All occupant entries at pos (empty if free)
    [[nodiscard]] const std::vector<CellOccupant>& occupants_at(const GridPosition& pos) const;

    /// Whether a support running along axis could pass through pos
    [[nodiscard]] bool is_cell_free_for_beam_axis(const GridPosition& pos, Axis axis) const;

    /// Validates a placement without changing anything
    [[nodiscard]] bool can_place(std::string_view definition_id, const GridPosition& position,
                                 const Rotation& rotation = {},
                                 std::optional<Axis> orientation = std::nullopt) const;

    /// Same as can_place(), but cells owned by ignore_id count as free (drag-to-move)
    [[nodiscard]] bool can_place_ignoring(std::string_view definition_id,
                                          const GridPosition& position, const Rotation& rotation,
                                          PartId ignore_id,
                                          std::optional<Axis> orientation = std::nullopt) const;

    [[nodiscard]] const PlacedPart* get_part_by_id(PartId id) const;

    /// All placed parts in placement order
    [[nodiscard]] std::vector<PlacedPart> get_all_parts() const;

    [[nodiscard]] size_t part_count() const { return parts_.size(); }

    [[nodiscard]] const AssemblySettings& settings() const { return settings_; }

    // --- Mutations ---

    /// Places a part if valid. Returns the new instance id, or nullopt on
    /// an unknown definition or an illegal placement.
    std::optional<PartId> add_part(std::string_view definition_id, const GridPosition& position,
                                   const Rotation& rotation = {},
                                   std::optional<Axis> orientation = std::nullopt,
                                   std::optional<std::string> color = std::nullopt);

    /// Removes a part. Returns the removed record, or nullopt if id is unknown.
    std::optional<PlacedPart> remove_part(PartId id);

    /// Removes every part
    void clear();

    /// Sets or resets (nullopt) a part's display color. Returns false if id is unknown.
    bool set_part_color(PartId id, std::optional<std::string> color);

    void set_settings(const AssemblySettings& settings);

    // --- Persistence ---

    [[nodiscard]] AssemblyFile serialize(const std::string& name = "My Rack") const;

    /// Replaces the contents with a document's parts. Entries that no longer
    /// place (unknown type, collision) are skipped and logged.
    /// @return Number of parts restored
    size_t deserialize(const AssemblyFile& file);

    // --- Change notification ---

    SubscriptionId subscribe(ChangeListener listener);
    void unsubscribe(SubscriptionId id);

  private:
    /// Shared body of can_place / can_place_ignoring
    bool validate(const PartDefinition& def, const GridPosition& position,
                  const Rotation& rotation, Axis orientation,
                  std::optional<PartId> ignore_id) const;

    bool is_cell_free(const GridPosition& pos, const CellClaim& claim,
                      std::optional<Axis> pull_through, std::optional<PartId> ignore_id) const;

    bool is_custom_part(PartId id) const;

    void notify();

    const Catalog* catalog_;
    std::map<PartId, PlacedPart> parts_;
    std::unordered_map<GridPosition, std::vector<CellOccupant>, GridPositionHash> occupancy_;
    AssemblySettings settings_;
    PartId next_part_id_ = 1;

    std::map<SubscriptionId, ChangeListener> listeners_;
    SubscriptionId next_subscription_id_ = 1;
};

/// Occupancy claim a definition makes once placed. Supports claim their
/// orientation axis whatever the rotation; everything else claims the full cell.
[[nodiscard]] CellClaim claim_for(const PartDefinition& def, const Rotation& rotation,
                                  Axis orientation);

/// The definition's pull-through axis after rotation, if it has one
[[nodiscard]] std::optional<Axis> effective_pull_through_axis(const PartDefinition& def,
                                                              const Rotation& rotation);

/// True if any connector arm would reach a cell below Y = 0
[[nodiscard]] bool has_arm_below_ground(const PartDefinition& def, const GridPosition& position,
                                        const Rotation& rotation, Axis orientation);

} // namespace framekit
