/// @file test_assembly_file.cpp
/// @brief Tests for assembly documents and settings — JSON encoding, legacy rotation, errors

#include <catch2/catch_test_macros.hpp>

#include "assembly/assembly.hpp"
#include "assembly/assembly_file.hpp"
#include "catalog/catalog.hpp"

#include <string>

using namespace framekit;

TEST_CASE("Assembly survives a save and load", "[assembly_file]") {
    Catalog catalog = Catalog::builtin();
    Assembly saved(catalog);

    REQUIRE(saved.add_part("support-3u", {0, 0, 0}, {}, Axis::X, std::string("#3366ff"))
                .has_value());
    REQUIRE(saved.add_part("connector-2d2w", {3, 0, 0}, {0, 90, 0}).has_value());
    REQUIRE(saved.add_part("support-2u", {0, 2, 0}, {0, 0, 90}).has_value());

    std::string text = assembly_file_to_json(saved.serialize("Bench"));
    AssemblyFile file = parse_assembly_file(text);
    CHECK(file.name == "Bench");
    CHECK(file.version == ASSEMBLY_FILE_VERSION);
    REQUIRE(file.parts.size() == 3);

    Assembly restored(catalog);
    CHECK(restored.deserialize(file) == 3);

    auto before = saved.get_all_parts();
    auto after = restored.get_all_parts();
    REQUIRE(after.size() == before.size());
    for (size_t i = 0; i < before.size(); i++) {
        CHECK(after[i].definition_id == before[i].definition_id);
        CHECK(after[i].position == before[i].position);
        CHECK(after[i].rotation == before[i].rotation);
        CHECK(after[i].orientation == before[i].orientation);
        CHECK(after[i].color == before[i].color);
    }
    CHECK(restored.is_occupied({2, 0, 0}));
    CHECK(restored.is_occupied({-1, 2, 0}));
}

TEST_CASE("Document layout", "[assembly_file]") {
    AssemblyFile file;
    file.name = "Shelf";
    AssemblyFileEntry entry;
    entry.type = "support-4u";
    entry.position = {1, 2, 3};
    entry.rotation = Rotation::from_degrees(90, 0, 270);
    entry.orientation = Axis::Z;
    file.parts.push_back(entry);

    std::string text = assembly_file_to_json(file);
    CHECK(text.find("\"version\": \"1.0\"") != std::string::npos);
    CHECK(text.find("\"name\": \"Shelf\"") != std::string::npos);
    CHECK(text.find("\"type\": \"support-4u\"") != std::string::npos);
    CHECK(text.find("\"orientation\": \"z\"") != std::string::npos);
    CHECK(text.find("\"color\"") == std::string::npos);
}

TEST_CASE("Older single-number rotation means a turn about Y", "[assembly_file]") {
    const std::string text = R"({
        "version": "1.0",
        "name": "Old",
        "parts": [
            {"type": "connector-2d2w", "position": [0, 1, 0], "rotation": 90}
        ]
    })";

    AssemblyFile file = parse_assembly_file(text);
    REQUIRE(file.parts.size() == 1);
    REQUIRE(file.parts[0].legacy_rotation.has_value());
    CHECK(*file.parts[0].legacy_rotation == 90);

    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    CHECK(assembly.deserialize(file) == 1);
    CHECK(assembly.get_all_parts()[0].rotation == Rotation{0, 90, 0});
}

TEST_CASE("Entries that no longer place are skipped", "[assembly_file]") {
    const std::string text = R"({
        "parts": [
            {"type": "support-3u", "position": [0, 0, 0]},
            {"type": "support-3u", "position": [0, 1, 0]},
            {"type": "flux-capacitor", "position": [5, 0, 5]},
            {"type": "support-3u", "position": [0, 1, 0], "orientation": "x"}
        ]
    })";

    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    REQUIRE(assembly.add_part("connector-1d1w", {9, 0, 9}).has_value());

    AssemblyFile file = parse_assembly_file(text);
    CHECK(file.name == "My Rack");
    CHECK(assembly.deserialize(file) == 2);
    CHECK(assembly.part_count() == 2);
    // Loading replaces what was there
    CHECK_FALSE(assembly.is_occupied({9, 0, 9}));
}

TEST_CASE("Off-grid single-number rotation skips only that entry", "[assembly_file]") {
    const std::string text = R"({
        "parts": [
            {"type": "support-3u", "position": [0, 0, 0]},
            {"type": "connector-2d2w", "position": [4, 0, 4], "rotation": 45},
            {"type": "connector-1d2w", "position": [0, 3, 0], "rotation": -90}
        ]
    })";

    AssemblyFile file = parse_assembly_file(text);
    REQUIRE(file.parts.size() == 3);
    CHECK(*file.parts[1].legacy_rotation == 45);

    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    CHECK(assembly.deserialize(file) == 2);

    auto parts = assembly.get_all_parts();
    REQUIRE(parts.size() == 2);
    CHECK(parts[0].definition_id == "support-3u");
    CHECK(parts[1].definition_id == "connector-1d2w");
    CHECK(parts[1].rotation == Rotation{0, 270, 0});
    CHECK_FALSE(assembly.is_occupied({4, 0, 4}));
}

TEST_CASE("Deserialize tolerates a hand-built off-grid rotation", "[assembly_file]") {
    AssemblyFile file;
    AssemblyFileEntry bad;
    bad.type = "support-2u";
    bad.position = {0, 0, 0};
    bad.legacy_rotation = 45;
    AssemblyFileEntry good;
    good.type = "support-2u";
    good.position = {2, 0, 0};
    good.legacy_rotation = 180;
    file.parts = {bad, good};

    Catalog catalog = Catalog::builtin();
    Assembly assembly(catalog);
    size_t restored = 0;
    CHECK_NOTHROW(restored = assembly.deserialize(file));
    CHECK(restored == 1);

    auto parts = assembly.get_all_parts();
    REQUIRE(parts.size() == 1);
    CHECK(parts[0].position == GridPosition{2, 0, 0});
    CHECK(parts[0].rotation == Rotation{0, 180, 0});
    CHECK_FALSE(assembly.is_occupied({0, 0, 0}));
}

TEST_CASE("Malformed documents are rejected", "[assembly_file]") {
    SECTION("Not JSON") {
        CHECK_THROWS_AS(parse_assembly_file("{ parts: "), AssemblyFileError);
    }
    SECTION("No parts array") {
        CHECK_THROWS_AS(parse_assembly_file(R"({"name": "x"})"), AssemblyFileError);
        CHECK_THROWS_AS(parse_assembly_file(R"([1, 2, 3])"), AssemblyFileError);
    }
    SECTION("Part without a type") {
        CHECK_THROWS_AS(parse_assembly_file(R"({"parts": [{"position": [0, 0, 0]}]})"),
                        AssemblyFileError);
    }
    SECTION("Bad position") {
        CHECK_THROWS_AS(parse_assembly_file(R"({"parts": [{"type": "a", "position": [0, 0]}]})"),
                        AssemblyFileError);
        CHECK_THROWS_AS(
            parse_assembly_file(R"({"parts": [{"type": "a", "position": [0, 0.5, 0]}]})"),
            AssemblyFileError);
        CHECK_THROWS_AS(parse_assembly_file(R"({"parts": [{"type": "a"}]})"), AssemblyFileError);
        CHECK_THROWS_AS(
            parse_assembly_file(R"({"parts": [{"type": "a", "position": [1e20, 0, 0]}]})"),
            AssemblyFileError);
        CHECK_THROWS_AS(
            parse_assembly_file(R"({"parts": [{"type": "a", "position": [0, -3e9, 0]}]})"),
            AssemblyFileError);
    }
    SECTION("Unknown orientation") {
        CHECK_THROWS_AS(parse_assembly_file(
                            R"({"parts": [{"type": "a", "position": [0, 0, 0], "orientation": "w"}]})"),
                        AssemblyFileError);
    }
    SECTION("Bad rotation") {
        CHECK_THROWS_AS(
            parse_assembly_file(
                R"({"parts": [{"type": "a", "position": [0, 0, 0], "rotation": 1e12}]})"),
            AssemblyFileError);
        CHECK_THROWS_AS(
            parse_assembly_file(
                R"({"parts": [{"type": "a", "position": [0, 0, 0], "rotation": [0, 30, 0]}]})"),
            AssemblyFileError);
    }
}

TEST_CASE("Settings", "[assembly_file]") {
    SECTION("Round trip") {
        AssemblySettings settings;
        settings.custom_parts_skip_collision = true;
        settings.snap_enabled = false;
        AssemblySettings back = parse_settings(settings_to_json(settings));
        CHECK(back.custom_parts_skip_collision);
        CHECK_FALSE(back.snap_enabled);
    }

    SECTION("Missing keys keep their defaults") {
        AssemblySettings settings = parse_settings(R"({"customPartsSkipCollision": true})");
        CHECK(settings.custom_parts_skip_collision);
        CHECK(settings.snap_enabled);

        AssemblySettings empty = parse_settings("{}");
        CHECK_FALSE(empty.custom_parts_skip_collision);
        CHECK(empty.snap_enabled);
    }

    SECTION("Unreadable settings throw") {
        CHECK_THROWS_AS(parse_settings("not json"), AssemblyFileError);
    }
}
