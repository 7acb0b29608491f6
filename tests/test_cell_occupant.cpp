/// @file test_cell_occupant.cpp
/// @brief Tests for the cell coexistence rule

#include <catch2/catch_test_macros.hpp>

#include "assembly/cell_occupant.hpp"

using namespace framekit;

namespace {

CellOccupant beam_occupant(Axis axis) {
    return {1, CellClaim::beam(axis), std::nullopt};
}

CellOccupant full_occupant(std::optional<Axis> pull_through = std::nullopt) {
    return {1, CellClaim::whole_cell(), pull_through};
}

} // namespace

TEST_CASE("Beams share a cell only on different axes", "[occupancy]") {
    CHECK(can_coexist(beam_occupant(Axis::X), CellClaim::beam(Axis::Y), std::nullopt));
    CHECK(can_coexist(beam_occupant(Axis::Z), CellClaim::beam(Axis::X), std::nullopt));
    CHECK_FALSE(can_coexist(beam_occupant(Axis::Y), CellClaim::beam(Axis::Y), std::nullopt));
}

TEST_CASE("Full occupants block everything", "[occupancy]") {
    CHECK_FALSE(can_coexist(full_occupant(), CellClaim::whole_cell(), std::nullopt));
    CHECK_FALSE(can_coexist(full_occupant(), CellClaim::beam(Axis::X), std::nullopt));
    CHECK_FALSE(can_coexist(beam_occupant(Axis::X), CellClaim::whole_cell(), std::nullopt));
}

TEST_CASE("Pull-through lets a beam pass on the matching axis", "[occupancy]") {
    SECTION("Beam arrives after the connector") {
        CHECK(can_coexist(full_occupant(Axis::X), CellClaim::beam(Axis::X), std::nullopt));
        CHECK_FALSE(can_coexist(full_occupant(Axis::X), CellClaim::beam(Axis::Z), std::nullopt));
    }
    SECTION("Connector arrives after the beam") {
        CHECK(can_coexist(beam_occupant(Axis::Z), CellClaim::whole_cell(), Axis::Z));
        CHECK_FALSE(can_coexist(beam_occupant(Axis::Y), CellClaim::whole_cell(), Axis::Z));
    }
    SECTION("Two pull-through parts still block each other") {
        CHECK_FALSE(can_coexist(full_occupant(Axis::X), CellClaim::whole_cell(), Axis::X));
    }
}

TEST_CASE("Claim equality ignores the axis of full claims", "[occupancy]") {
    CHECK(CellClaim::whole_cell() == CellClaim{true, Axis::Z});
    CHECK(CellClaim::beam(Axis::X) == CellClaim::beam(Axis::X));
    CHECK_FALSE(CellClaim::beam(Axis::X) == CellClaim::beam(Axis::Y));
    CHECK_FALSE(CellClaim::beam(Axis::X) == CellClaim::whole_cell());
}
