#pragma once

/// @file assembly_file.hpp
/// @brief Persisted assembly and settings documents, and their JSON encoding
///
/// Document layout (version "1.0"):
///
///   {
///     "version": "1.0",
///     "name": "My Rack",
///     "parts": [
///       { "type": "support-3u", "position": [0, 0, 0], "rotation": [0, 0, 0],
///         "orientation": "x", "color": "#ff0000" }
///     ]
///   }
///
/// "rotation" may also be a single number (older saves), meaning a rotation
/// about Y only. "orientation" and "color" are optional.

#include "geometry/grid_types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace framekit {

inline constexpr std::string_view ASSEMBLY_FILE_VERSION = "1.0";

/// One serialized part
struct AssemblyFileEntry {
    std::string type;
    GridPosition position;
    Rotation rotation;
    std::optional<int> legacy_rotation; ///< Set when the file stored a single number
    std::optional<Axis> orientation;
    std::optional<std::string> color;
};

struct AssemblyFile {
    std::string version{ASSEMBLY_FILE_VERSION};
    std::string name = "My Rack";
    std::vector<AssemblyFileEntry> parts;
};

/// User-facing model settings, persisted separately from assemblies
struct AssemblySettings {
    bool custom_parts_skip_collision = false; ///< Custom parts ignore collisions entirely
    bool snap_enabled = true;                 ///< Placement snaps to nearby sockets
};

/// Thrown when a persisted document cannot be decoded
class AssemblyFileError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Encodes an assembly document as pretty-printed JSON
[[nodiscard]] std::string assembly_file_to_json(const AssemblyFile& file);

/// Decodes an assembly document.
/// @throws AssemblyFileError on malformed JSON or a structurally invalid document
[[nodiscard]] AssemblyFile parse_assembly_file(const std::string& text);

[[nodiscard]] std::string settings_to_json(const AssemblySettings& settings);

/// Decodes settings. Missing keys keep their defaults.
/// @throws AssemblyFileError on malformed JSON
[[nodiscard]] AssemblySettings parse_settings(const std::string& text);

} // namespace framekit
