#ifndef PSYNC_COLOR_COLORCODEC_H
#define PSYNC_COLOR_COLORCODEC_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace PSYNC::Color {
    // 8-bit-per-channel sRGB color. Canonical text form is "#rrggbb".
    struct Color {
        uint8_t r{0};
        uint8_t g{0};
        uint8_t b{0};
    };

    inline bool operator==(const Color &lhs, const Color &rhs) {
        return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
    }

    inline bool operator!=(const Color &lhs, const Color &rhs) {
        return !(lhs == rhs);
    }

    using Rgb = std::array<uint8_t, 3>;

    constexpr Color kWhite{0xFF, 0xFF, 0xFF};
    constexpr Color kBlack{0x00, 0x00, 0x00};

    /**
     * @brief Parse "#RRGGBB" (any case) after trimming surrounding whitespace
     *
     * Three-digit shorthand, missing '#' and trailing garbage are rejected.
     */
    std::optional<Color> ParseHexColor(std::string_view text);

    // Lowercase "#rrggbb"
    std::string FormatHexColor(const Color &color);

    inline Rgb ToRgb(const Color &color) {
        return {color.r, color.g, color.b};
    }

    inline Color FromRgb(const Rgb &rgb) {
        return {rgb[0], rgb[1], rgb[2]};
    }
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_COLORCODEC_H
