#ifndef PSYNC_COLOR_PALETTEDERIVER_H
#define PSYNC_COLOR_PALETTEDERIVER_H

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ColorCodec.h"

namespace PSYNC::Color {
    struct ThresholdConfig {
        double background_luminance{0.26};  // corrections run below this
        double saturation_boost{1.35};
        double max_accent_luminance{0.55};
        double min_accent_contrast{3.5};
        double contrast_floor_luminance{0.15};
    };

    // Used for any slot the theme leaves empty (gruvbox dark).
    struct FallbackColors {
        Color foreground{0xFB, 0xF1, 0xC7};
        Color background{0x3C, 0x38, 0x36};
        Color red{0xCC, 0x24, 0x1D};
        Color green{0x98, 0x97, 0x1A};
        Color yellow{0xD7, 0x99, 0x21};
        Color blue{0x45, 0x85, 0x88};
        Color purple{0xB1, 0x62, 0x86};
        Color aqua{0x68, 0x9D, 0x6A};
    };

    // Raw colors as reported by the terminal. Absent or malformed entries are simply missing.
    struct ThemeColors {
        std::optional<Color> foreground;
        std::optional<Color> background;
        std::optional<Color> selection_background;
        std::map<int, Color> palette;
    };

    struct Palette {
        Color fg0;
        Color bg1;
        Color bg3;
        Color on_bg1;
        Color on_bg3;
        Color on_blue;
        Color on_aqua;
        Color on_green;
        Color on_orange;
        Color on_purple;
        Color on_red;
        Color on_yellow;
        Color blue;
        Color aqua;
        Color green;
        Color orange;
        Color purple;
        Color red;
        Color yellow;
    };

    struct PaletteSlot {
        const char *key;
        Color Palette::*member;
    };

    constexpr size_t kPaletteSlotCount = 19;

    // Output keys in their stable emission order.
    const std::array<PaletteSlot, kPaletteSlotCount> &GetPaletteSlots();

    // (key, "#rrggbb") pairs in slot order.
    std::vector<std::pair<std::string, std::string>> ToNamedEntries(const Palette &palette);

    /**
     * @brief Pick the candidate with the highest contrast against the surface
     *
     * Candidates are normalized and deduplicated first; ties keep the earliest
     * candidate. Returns white when no candidate survives normalization.
     */
    Color BestContrastText(const Color &surface, const std::vector<std::string> &candidates);
    Color BestContrastText(const Color &surface, const std::vector<Color> &candidates);

    using AccentTransform = std::function<Color(const Color &)>;

    AccentTransform MakeSaturationBoost(double factor);
    AccentTransform MakeLuminanceCeiling(double ceiling);
    AccentTransform MakeContrastFloor(const Color &background, double min_contrast, double floor_luminance);

    // Boost, ceiling, then contrast floor.
    std::vector<AccentTransform> BuildDarkThemeCorrections(const Color &background,
                                                           const ThresholdConfig &thresholds);

    Color ApplyCorrections(const Color &accent, const std::vector<AccentTransform> &chain);

    bool IsDarkBackground(const Color &background, const ThresholdConfig &thresholds);

    Palette DerivePalette(const ThemeColors &theme,
                          const ThresholdConfig &thresholds = {},
                          const FallbackColors &fallback = {});
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_PALETTEDERIVER_H
