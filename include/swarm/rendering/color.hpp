/**
 * @file color.hpp
 * @brief RGB colour parsing and HSL lightness adjustment for particle tints
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Rendering {

/**
 * @brief 8-bit RGBA colour
 */
struct Rgba {
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;
    std::uint8_t a = 255;

    bool operator==(const Rgba& o) const {
        return r == o.r && g == o.g && b == o.b && a == o.a;
    }
};

/**
 * @brief Parses "#RRGGBB" or "RRGGBB" (case-insensitive)
 * @return The opaque colour, or std::nullopt on malformed input
 */
std::optional<Rgba> parseHexColor(const std::string& hex);

/**
 * @brief Shifts the HSL lightness of a colour
 *
 * @param color Base colour (alpha is preserved)
 * @param delta Lightness offset in [-1, 1]; the result is clamped to [0, 1]
 */
Rgba offsetLightness(const Rgba& color, double delta);

} // namespace Rendering
