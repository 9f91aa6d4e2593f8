#pragma once

#include "bulbnet/core/Expected.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace bulbnet {

struct RgbColor {
    std::uint8_t r = 255;
    std::uint8_t g = 255;
    std::uint8_t b = 255;

    friend bool operator==(const RgbColor& a, const RgbColor& b) {
        return a.r == b.r && a.g == b.g && a.b == b.b;
    }
    friend bool operator!=(const RgbColor& a, const RgbColor& b) { return !(a == b); }
};

/**
 * @brief Build a colour from integer channels, rejecting anything outside 0-255
 * with Errc::CallerError.
 */
expected<RgbColor> makeRgb(int r, int g, int b);

/**
 * @brief Decode "RRGGBB" or "#RRGGBB" (either case).
 *
 * Wrong length or a non-hex digit is Errc::CallerError.
 */
expected<RgbColor> parseHexColor(std::string_view text);

/// Encode as "#RRGGBB" with uppercase digits.
std::string toHex(const RgbColor& color);

} // namespace bulbnet
