/// @file test_snap_engine.cpp
/// @brief Tests for snap candidate search — sockets, support ends, pull-through spans, rays

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "assembly/assembly.hpp"
#include "bom/bom.hpp"
#include "catalog/catalog.hpp"
#include "snap/snap_engine.hpp"

using namespace framekit;

TEST_CASE("Ray to point distance", "[snap]") {
    GridRay ray{{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};

    CHECK(ray_to_point_distance(ray, {5, 3, 0}) == Catch::Approx(3.0));
    CHECK(ray_to_point_distance(ray, {5, 0, 0}) == Catch::Approx(0.0));

    // Points behind the origin measure from the origin itself
    CHECK(ray_to_point_distance(ray, {-4, 3, 0}) == Catch::Approx(5.0));

    GridRay degenerate{{1.0, 1.0, 1.0}, {0.0, 0.0, 0.0}};
    CHECK(ray_to_point_distance(degenerate, {1, 1, 3}) == Catch::Approx(2.0));
}

TEST_CASE("Snap distance prefers the ray or the ground projection, whichever is closer",
          "[snap]") {
    SnapDistance flat = snap_distance({0, 0, 0}, {3, 4, 0}, std::nullopt);
    CHECK(flat.filter == Catch::Approx(3.0));
    CHECK(flat.sort == Catch::Approx(3.0 + 0.05));

    GridRay down{{3.0, 10.0, 0.0}, {0.0, -1.0, 0.0}};
    SnapDistance with_ray = snap_distance({0, 0, 0}, {3, 4, 0}, down);
    CHECK(with_ray.filter == Catch::Approx(0.0));
    CHECK(with_ray.sort == Catch::Approx(0.05));
}

TEST_CASE("Support snaps to open connector sockets", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);

    // Arms +Y and +X, turned a quarter about X so +Y becomes +Z
    REQUIRE(assembly.add_part("connector-2d2w", {5, 0, 5}, {90, 0, 0}).has_value());

    auto candidates = find_snap_points(assembly, "support-5u", {5, 0, 5});
    REQUIRE(candidates.size() == 2);

    CHECK(candidates[0].position == GridPosition{5, 0, 6});
    CHECK(candidates[0].orientation == Axis::Z);
    CHECK(candidates[0].socket_direction == Direction::POS_Z);
    CHECK(candidates[0].distance == Catch::Approx(1.01));

    CHECK(candidates[1].position == GridPosition{6, 0, 5});
    CHECK(candidates[1].orientation == Axis::X);
    CHECK(candidates[1].socket_direction == Direction::POS_X);
    CHECK(candidates[1].distance == Catch::Approx(1.01));

    for (const SnapCandidate& c : candidates) {
        CHECK(c.anchor_part_id == assembly.get_all_parts()[0].id);
        CHECK(assembly.can_place("support-5u", c.position, {}, c.orientation));
    }
}

TEST_CASE("Negative sockets place the support so its far end meets the socket", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    REQUIRE(assembly.add_part("connector-1d2w", {0, 3, 0}).has_value());

    auto best = find_best_snap(assembly, "support-3u", {0, 0, 0});
    REQUIRE(best.has_value());
    CHECK(best->position == GridPosition{0, 0, 0});
    CHECK(best->orientation == Axis::Y);
    CHECK(best->socket_direction == Direction::NEG_Y);
    CHECK(best->distance == Catch::Approx(0.02));

    REQUIRE(assembly.add_part("support-3u", best->position, {}, best->orientation).has_value());

    // The filled socket is no longer offered
    auto remaining = find_snap_points(assembly, "support-3u", {0, 0, 0}, 5.0);
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0].position == GridPosition{0, 4, 0});
    CHECK(remaining[0].socket_direction == Direction::POS_Y);
}

TEST_CASE("Snap search radius and pick ray", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    REQUIRE(assembly.add_part("connector-1d2w", {0, 3, 0}).has_value());

    SECTION("Far cursor without a ray finds nothing") {
        CHECK(find_snap_points(assembly, "support-3u", {10, 0, 10}).empty());
        CHECK_FALSE(find_best_snap(assembly, "support-3u", {10, 0, 10}).has_value());
    }

    SECTION("A ray through the sockets rescues a far cursor") {
        GridRay ray{{0.0, 10.0, 0.0}, {0.0, -1.0, 0.0}};
        auto candidates = find_snap_points(assembly, "support-3u", {10, 0, 10},
                                           DEFAULT_SNAP_RADIUS, ray);
        REQUIRE(candidates.size() == 2);
        // Both lie on the ray, so the 3D tie-breaker picks the lower socket
        CHECK(candidates[0].socket_direction == Direction::NEG_Y);
        CHECK(candidates[1].socket_direction == Direction::POS_Y);
    }

    SECTION("Only supports snap to sockets") {
        CHECK(find_snap_points(assembly, "connector-1d2w", {0, 0, 0}).empty());
        CHECK(find_snap_points(assembly, "no-such-part", {0, 0, 0}).empty());
    }
}

TEST_CASE("Connector snaps to free support ends", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);

    REQUIRE(assembly.add_part("support-3u", {0, 0, 0}).has_value());
    REQUIRE(assembly.add_part("support-3u", {1, 3, 0}, {}, Axis::X).has_value());

    auto candidates = find_connector_snap_points(assembly, "connector-2d2w", {0, 0, 0});
    // The lower end is underground and the far end of the X beam is out of range
    REQUIRE(candidates.size() == 2);
    CHECK(candidates[0].position == GridPosition{0, 3, 0});
    CHECK(candidates[0].socket_direction == Direction::POS_Y);
    CHECK(candidates[1].position == GridPosition{0, 3, 0});
    CHECK(candidates[1].socket_direction == Direction::NEG_X);

    SECTION("Best snap turns the connector to face both supports") {
        auto best = find_best_connector_snap(assembly, "connector-2d2w", {0, 0, 0});
        REQUIRE(best.has_value());
        REQUIRE(best->auto_rotation.has_value());
        CHECK(*best->auto_rotation == Rotation{0, 0, 270});

        REQUIRE(assembly.add_part("connector-2d2w", best->position, *best->auto_rotation)
                    .has_value());
        CHECK(count_pinned_joints(assembly) == 2);

        // The socket is now taken
        CHECK(find_connector_snap_points(assembly, "connector-2d2w", {0, 0, 0}).empty());
    }
}

TEST_CASE("Pull-through connectors snap to mid-span cells on their axis", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    REQUIRE(assembly.add_part("support-5u", {0, 0, 0}, {}, Axis::X).has_value());

    SECTION("Tunnel turned onto the beam axis") {
        const Rotation turned{0, 90, 0};
        auto candidates = find_connector_snap_points(assembly, "connector-2d2w-pt-z", {2, 0, 0},
                                                     DEFAULT_SNAP_RADIUS, std::nullopt, turned);
        // Three interior cells plus both free ends
        REQUIRE(candidates.size() == 5);
        CHECK(candidates[0].position == GridPosition{2, 0, 0});
        CHECK(candidates[0].socket_direction == Direction::POS_X);
        CHECK(candidates[0].distance == Catch::Approx(0.0));

        CHECK(assembly.add_part("connector-2d2w-pt-z", candidates[0].position, turned)
                  .has_value());
    }

    SECTION("Tunnel across the beam only sees the ends") {
        auto candidates = find_connector_snap_points(assembly, "connector-2d2w-pt-z", {2, 0, 0});
        REQUIRE(candidates.size() == 2);
        CHECK(candidates[0].position == GridPosition{-1, 0, 0});
        CHECK(candidates[1].position == GridPosition{5, 0, 0});
    }
}

TEST_CASE("Pull-through spans match the beam's orientation axis", "[snap]") {
    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);

    // Oriented X but turned about X, so its cells run along Z
    REQUIRE(assembly.add_part("support-5u", {0, 0, 0}, {90, 0, 0}, Axis::X).has_value());
    REQUIRE(assembly.is_occupied({0, 0, 4}));

    SECTION("Tunnel along X sees the mid-span cells") {
        const Rotation turned{0, 90, 0};
        auto candidates = find_connector_snap_points(assembly, "connector-2d2w-pt-z", {0, 0, 2},
                                                     DEFAULT_SNAP_RADIUS, std::nullopt, turned);
        REQUIRE(candidates.size() == 5);
        CHECK(candidates[0].position == GridPosition{0, 0, 2});
        CHECK(candidates[0].socket_direction == Direction::POS_X);

        CHECK(assembly.add_part("connector-2d2w-pt-z", candidates[0].position, turned)
                  .has_value());
    }

    SECTION("Tunnel along Z only sees the ends") {
        auto candidates = find_connector_snap_points(assembly, "connector-2d2w-pt-z", {0, 0, 2});
        REQUIRE(candidates.size() == 2);
        CHECK(candidates[0].position == GridPosition{0, 0, -1});
        CHECK(candidates[1].position == GridPosition{0, 0, 5});
    }
}
