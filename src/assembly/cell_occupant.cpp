/// @file cell_occupant.cpp
/// @brief Cell coexistence rule

#include "assembly/cell_occupant.hpp"

namespace framekit {

bool can_coexist(const CellOccupant& existing, const CellClaim& incoming,
                 std::optional<Axis> incoming_pull_through) {
    if (existing.claim.full && incoming.full) {
        return false;
    }
    if (existing.claim.full) {
        return existing.pull_through_axis.has_value() && *existing.pull_through_axis == incoming.axis;
    }
    if (incoming.full) {
        return incoming_pull_through.has_value() && *incoming_pull_through == existing.claim.axis;
    }
    return existing.claim.axis != incoming.axis;
}

} // namespace framekit
