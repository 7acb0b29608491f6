/// @file test_grid_transform.cpp
/// @brief Tests for quarter-turn rotation, orientation remap and ground lift

#include <catch2/catch_test_macros.hpp>

#include "catalog/catalog.hpp"
#include "geometry/grid_transform.hpp"

#include <stdexcept>
#include <vector>

using namespace framekit;

TEST_CASE("Single quarter turns follow the right-hand rule", "[transform]") {
    SECTION("About X: (x, y, z) -> (x, -z, y)") {
        CHECK(rotate_cell({1, 2, 3}, {90, 0, 0}) == GridPosition{1, -3, 2});
    }
    SECTION("About Y: (x, y, z) -> (z, y, -x)") {
        CHECK(rotate_cell({1, 2, 3}, {0, 90, 0}) == GridPosition{3, 2, -1});
    }
    SECTION("About Z: (x, y, z) -> (-y, x, z)") {
        CHECK(rotate_cell({1, 2, 3}, {0, 0, 90}) == GridPosition{-2, 1, 3});
    }
}

TEST_CASE("Four quarter turns about one axis are the identity", "[transform]") {
    const std::vector<GridPosition> cells = {{0, 0, 0}, {1, 0, 0}, {0, 1, 0}, {2, -3, 5}, {-4, 7, 1}};
    for (const GridPosition& cell : cells) {
        for (Axis axis : {Axis::X, Axis::Y, Axis::Z}) {
            Rotation quarter{axis == Axis::X ? 90 : 0, axis == Axis::Y ? 90 : 0,
                             axis == Axis::Z ? 90 : 0};
            GridPosition p = cell;
            for (int i = 0; i < 4; i++) {
                p = rotate_cell(p, quarter);
            }
            CHECK(p == cell);
        }
    }
}

TEST_CASE("Rotations compose Z first, then Y, then X", "[transform]") {
    // Z takes +x to +y, then Y leaves +y alone. The other order would give -z.
    CHECK(rotate_cell({1, 0, 0}, {0, 90, 90}) == GridPosition{0, 1, 0});
    CHECK(rotate_direction(Direction::POS_X, {0, 90, 90}) == Direction::POS_Y);
}

TEST_CASE("Direction and axis rotation", "[transform]") {
    CHECK(rotate_direction(Direction::POS_Y, {90, 0, 0}) == Direction::POS_Z);
    CHECK(rotate_direction(Direction::POS_Y, {180, 0, 0}) == Direction::NEG_Y);
    CHECK(rotate_direction(Direction::POS_X, {0, 90, 0}) == Direction::NEG_Z);
    CHECK(rotate_axis(Axis::Z, {0, 90, 0}) == Axis::X);
    CHECK(rotate_axis(Axis::Y, {0, 270, 0}) == Axis::Y);
}

TEST_CASE("Orientation remap swaps components", "[transform]") {
    CHECK(transform_cell({0, 2, 0}, Axis::Y) == GridPosition{0, 2, 0});
    CHECK(transform_cell({0, 2, 0}, Axis::X) == GridPosition{2, 0, 0});
    CHECK(transform_cell({0, 2, 0}, Axis::Z) == GridPosition{0, 0, 2});
    CHECK(transform_direction(Direction::NEG_Y, Axis::X) == Direction::NEG_X);
    CHECK(transform_axis(Axis::Y, Axis::Z) == Axis::Z);
}

TEST_CASE("Placement rotates before orienting", "[transform]") {
    // +y about Z becomes -x; orientation x then swaps it back onto -y
    CHECK(place_direction(Direction::POS_Y, {0, 0, 90}, Axis::X) == Direction::NEG_Y);
    CHECK(placed_beam_axis({0, 0, 90}, Axis::X) == Axis::Y);
    CHECK(placed_beam_axis({}, Axis::X) == Axis::X);
    CHECK(placed_beam_axis({90, 0, 0}, Axis::Y) == Axis::Z);
}

TEST_CASE("Vector to direction conversion", "[transform]") {
    CHECK(vector_direction({1, 0, 0}) == Direction::POS_X);
    CHECK(vector_direction({0, -1, 0}) == Direction::NEG_Y);
    CHECK(vector_direction({0, 0, 1}) == Direction::POS_Z);
    CHECK(vector_direction({0, 0, 0}) == Direction::NEG_Z);
    CHECK(adjacent({2, 2, 2}, Direction::NEG_X) == GridPosition{1, 2, 2});
    CHECK(opposite(Direction::POS_Z) == Direction::NEG_Z);
}

TEST_CASE("Orientation cycles y -> x -> z -> y", "[transform]") {
    CHECK(next_orientation(Axis::Y) == Axis::X);
    CHECK(next_orientation(Axis::X) == Axis::Z);
    CHECK(next_orientation(Axis::Z) == Axis::Y);
}

TEST_CASE("World cells of an oriented and a rotated support", "[transform]") {
    PartDefinition beam = make_support(3);

    auto along_x = world_cells(beam, {0, 0, 0}, {}, Axis::X);
    CHECK(along_x == std::vector<GridPosition>{{0, 0, 0}, {1, 0, 0}, {2, 0, 0}});

    auto about_x = world_cells(beam, {0, 0, 0}, {90, 0, 0}, Axis::Y);
    CHECK(about_x == std::vector<GridPosition>{{0, 0, 0}, {0, 0, 1}, {0, 0, 2}});

    auto offset = world_cells(beam, {4, 1, -2}, {}, Axis::Z);
    CHECK(offset == std::vector<GridPosition>{{4, 1, -2}, {4, 1, -1}, {4, 1, 0}});
}

TEST_CASE("Ground lift", "[transform]") {
    Catalog catalog = Catalog::builtin();

    SECTION("Upright support needs no lift") {
        CHECK(compute_ground_lift(*catalog.find("support-3u"), {}, Axis::Y) == 0);
    }
    SECTION("Support flipped about X hangs two cells below") {
        CHECK(compute_ground_lift(*catalog.find("support-3u"), {180, 0, 0}, Axis::Y) == 2);
    }
    SECTION("Downward connector arm counts") {
        CHECK(compute_ground_lift(*catalog.find("connector-1d2w"), {}, Axis::Y) == 1);
        CHECK(compute_ground_lift(*catalog.find("connector-1d1w"), {}, Axis::Y) == 0);
        CHECK(compute_ground_lift(*catalog.find("connector-1d1w"), {180, 0, 0}, Axis::Y) == 1);
    }
}

TEST_CASE("Rotation normalisation", "[transform]") {
    CHECK(Rotation::from_degrees(-90, 450, 360) == Rotation{270, 90, 0});
    CHECK(Rotation::from_degrees(0, 0, 0).is_identity());
    CHECK_THROWS_AS(Rotation::from_degrees(45, 0, 0), std::invalid_argument);
    CHECK(Rotation{180, 270, 90}.steps(Axis::Y) == 3);
}

TEST_CASE("Axis and direction names parse back", "[transform]") {
    CHECK(parse_axis("z") == Axis::Z);
    CHECK_FALSE(parse_axis("w").has_value());
    CHECK(parse_direction("-x") == Direction::NEG_X);
    CHECK(direction_name(Direction::POS_Z) == "+z");
    CHECK(axis_name(Axis::X) == "x");
}
