/// @file assembly_file.cpp
/// @brief JSON encoding of assembly documents and settings (nlohmann/json)

#include "assembly/assembly_file.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace framekit {

namespace {

using json = nlohmann::json;

int read_int(const json& value, const char* what) {
    if (!value.is_number()) {
        throw AssemblyFileError(std::string(what) + " must be a number");
    }
    double d = value.get<double>();
    if (std::floor(d) != d) {
        throw AssemblyFileError(std::string(what) + " must be an integer");
    }
    if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max())) {
        throw AssemblyFileError(std::string(what) + " is out of range");
    }
    return static_cast<int>(d);
}

GridPosition read_position(const json& value) {
    if (!value.is_array() || value.size() != 3) {
        throw AssemblyFileError("position must be an array of three integers");
    }
    return {read_int(value[0], "position"), read_int(value[1], "position"),
            read_int(value[2], "position")};
}

Rotation make_rotation(int x, int y, int z) {
    try {
        return Rotation::from_degrees(x, y, z);
    } catch (const std::invalid_argument& e) {
        throw AssemblyFileError(e.what());
    }
}

AssemblyFileEntry read_entry(const json& value) {
    if (!value.is_object()) {
        throw AssemblyFileError("part entry must be an object");
    }
    AssemblyFileEntry entry;

    auto type_it = value.find("type");
    if (type_it == value.end() || !type_it->is_string()) {
        throw AssemblyFileError("part entry is missing its type");
    }
    entry.type = type_it->get<std::string>();

    auto pos_it = value.find("position");
    if (pos_it == value.end()) {
        throw AssemblyFileError("part '" + entry.type + "' is missing its position");
    }
    entry.position = read_position(*pos_it);

    if (auto rot_it = value.find("rotation"); rot_it != value.end() && !rot_it->is_null()) {
        if (rot_it->is_array()) {
            if (rot_it->size() != 3) {
                throw AssemblyFileError("rotation must have three components");
            }
            entry.rotation = make_rotation(read_int((*rot_it)[0], "rotation"),
                                           read_int((*rot_it)[1], "rotation"),
                                           read_int((*rot_it)[2], "rotation"));
        } else {
            entry.legacy_rotation = read_int(*rot_it, "rotation");
        }
    }

    if (auto orient_it = value.find("orientation");
        orient_it != value.end() && !orient_it->is_null()) {
        if (!orient_it->is_string()) {
            throw AssemblyFileError("orientation must be a string");
        }
        entry.orientation = parse_axis(orient_it->get<std::string>());
        if (!entry.orientation) {
            throw AssemblyFileError("unknown orientation '" + orient_it->get<std::string>() + "'");
        }
    }

    if (auto color_it = value.find("color"); color_it != value.end() && color_it->is_string()) {
        entry.color = color_it->get<std::string>();
    }
    return entry;
}

json parse_json(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw AssemblyFileError(std::string("invalid JSON: ") + e.what());
    }
}

} // namespace

std::string assembly_file_to_json(const AssemblyFile& file) {
    json doc;
    doc["version"] = file.version;
    doc["name"] = file.name;
    doc["parts"] = json::array();
    for (const AssemblyFileEntry& entry : file.parts) {
        json part;
        part["type"] = entry.type;
        part["position"] = {entry.position.x, entry.position.y, entry.position.z};
        if (entry.legacy_rotation) {
            part["rotation"] = *entry.legacy_rotation;
        } else {
            part["rotation"] = {entry.rotation.x, entry.rotation.y, entry.rotation.z};
        }
        if (entry.orientation) {
            part["orientation"] = std::string(axis_name(*entry.orientation));
        }
        if (entry.color) {
            part["color"] = *entry.color;
        }
        doc["parts"].push_back(std::move(part));
    }
    return doc.dump(2);
}

AssemblyFile parse_assembly_file(const std::string& text) {
    json doc = parse_json(text);
    if (!doc.is_object()) {
        throw AssemblyFileError("assembly document must be an object");
    }

    AssemblyFile file;
    if (auto it = doc.find("version"); it != doc.end() && it->is_string()) {
        file.version = it->get<std::string>();
    }
    if (auto it = doc.find("name"); it != doc.end() && it->is_string()) {
        file.name = it->get<std::string>();
    }

    auto parts_it = doc.find("parts");
    if (parts_it == doc.end() || !parts_it->is_array()) {
        throw AssemblyFileError("assembly document has no parts array");
    }
    file.parts.reserve(parts_it->size());
    for (const json& part : *parts_it) {
        file.parts.push_back(read_entry(part));
    }
    return file;
}

std::string settings_to_json(const AssemblySettings& settings) {
    json doc;
    doc["customPartsSkipCollision"] = settings.custom_parts_skip_collision;
    doc["snapEnabled"] = settings.snap_enabled;
    return doc.dump(2);
}

AssemblySettings parse_settings(const std::string& text) {
    json doc = parse_json(text);
    AssemblySettings settings;
    if (!doc.is_object()) {
        return settings;
    }
    if (auto it = doc.find("customPartsSkipCollision"); it != doc.end() && it->is_boolean()) {
        settings.custom_parts_skip_collision = it->get<bool>();
    }
    if (auto it = doc.find("snapEnabled"); it != doc.end() && it->is_boolean()) {
        settings.snap_enabled = it->get<bool>();
    }
    return settings;
}

} // namespace framekit
