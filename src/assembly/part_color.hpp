#pragma once

/// @file part_color.hpp
/// @brief Display colour strings attached to placed parts ("#rrggbb")

#include <cstdint>
#include <optional>
#include <string_view>

namespace framekit {

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

/// Parses "#rrggbb" (either case). Anything else, including signs or
/// whitespace among the digits, yields nullopt.
[[nodiscard]] std::optional<Rgb> parse_hex_rgb(std::string_view text);

} // namespace framekit
