/// @file part_color.cpp
/// @brief Strict hex colour parsing

#include "assembly/part_color.hpp"

#include <cctype>

namespace framekit {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

} // namespace

std::optional<Rgb> parse_hex_rgb(std::string_view text) {
    if (text.size() != 7 || text[0] != '#') {
        return std::nullopt;
    }
    for (size_t i = 1; i < text.size(); i++) {
        if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    auto byte_at = [&](size_t i) {
        return static_cast<uint8_t>(hex_value(text[i]) * 16 + hex_value(text[i + 1]));
    };
    return Rgb{byte_at(1), byte_at(3), byte_at(5)};
}

} // namespace framekit
