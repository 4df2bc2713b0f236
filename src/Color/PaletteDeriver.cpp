#include "PaletteDeriver.h"

#include <algorithm>

#include "ColorBlender.h"
#include "LinearColorSpace.h"
#include "LuminanceScaler.h"
#include "SaturationAdjuster.h"

namespace PSYNC::Color {
    namespace {
        constexpr double kSelectionBlend = 0.25;
        constexpr double kOrangeBlend = 0.5;

        Color Resolve(const std::optional<Color> &primary,
                      const std::map<int, Color> &palette,
                      int slot,
                      const Color &fallback) {
            if (primary)
                return *primary;
            auto it = palette.find(slot);
            if (it != palette.end())
                return it->second;
            return fallback;
        }

        Color ResolveSlot(const std::map<int, Color> &palette, int slot, const Color &fallback) {
            return Resolve(std::nullopt, palette, slot, fallback);
        }
    } // namespace

    const std::array<PaletteSlot, kPaletteSlotCount> &GetPaletteSlots() {
        static const std::array<PaletteSlot, kPaletteSlotCount> slots = {{
            {"color_fg0", &Palette::fg0},
            {"color_bg1", &Palette::bg1},
            {"color_bg3", &Palette::bg3},
            {"color_on_bg1", &Palette::on_bg1},
            {"color_on_bg3", &Palette::on_bg3},
            {"color_on_blue", &Palette::on_blue},
            {"color_on_aqua", &Palette::on_aqua},
            {"color_on_green", &Palette::on_green},
            {"color_on_orange", &Palette::on_orange},
            {"color_on_purple", &Palette::on_purple},
            {"color_on_red", &Palette::on_red},
            {"color_on_yellow", &Palette::on_yellow},
            {"color_blue", &Palette::blue},
            {"color_aqua", &Palette::aqua},
            {"color_green", &Palette::green},
            {"color_orange", &Palette::orange},
            {"color_purple", &Palette::purple},
            {"color_red", &Palette::red},
            {"color_yellow", &Palette::yellow},
        }};
        return slots;
    }

    std::vector<std::pair<std::string, std::string>> ToNamedEntries(const Palette &palette) {
        std::vector<std::pair<std::string, std::string>> entries;
        entries.reserve(kPaletteSlotCount);
        for (const auto &slot : GetPaletteSlots())
            entries.emplace_back(slot.key, FormatHexColor(palette.*slot.member));
        return entries;
    }

    Color BestContrastText(const Color &surface, const std::vector<std::string> &candidates) {
        std::vector<Color> parsed;
        parsed.reserve(candidates.size());
        for (const auto &text : candidates) {
            if (auto color = ParseHexColor(text))
                parsed.push_back(*color);
        }
        return BestContrastText(surface, parsed);
    }

    Color BestContrastText(const Color &surface, const std::vector<Color> &candidates) {
        std::vector<Color> unique;
        for (const auto &color : candidates) {
            if (std::find(unique.begin(), unique.end(), color) == unique.end())
                unique.push_back(color);
        }

        if (unique.empty())
            return kWhite;

        Color best = unique.front();
        double bestRatio = ContrastRatio(surface, best);
        for (size_t i = 1; i < unique.size(); ++i) {
            const double ratio = ContrastRatio(surface, unique[i]);
            if (ratio > bestRatio) {
                bestRatio = ratio;
                best = unique[i];
            }
        }
        return best;
    }

    AccentTransform MakeSaturationBoost(double factor) {
        return [factor](const Color &accent) {
            return BoostSaturation(accent, factor);
        };
    }

    AccentTransform MakeLuminanceCeiling(double ceiling) {
        return [ceiling](const Color &accent) {
            if (RelativeLuminance(accent) > ceiling)
                return ScaleToLuminance(accent, ceiling);
            return accent;
        };
    }

    AccentTransform MakeContrastFloor(const Color &background, double min_contrast, double floor_luminance) {
        const double bgLum = RelativeLuminance(background);
        return [background, bgLum, min_contrast, floor_luminance](const Color &accent) {
            if (ContrastRatio(accent, background) >= min_contrast)
                return accent;
            // Accent has to be the lighter of the pair on a dark background
            double target = min_contrast * (bgLum + 0.05) - 0.05;
            target = std::max(target, floor_luminance);
            return ScaleToLuminance(accent, target);
        };
    }

    std::vector<AccentTransform> BuildDarkThemeCorrections(const Color &background,
                                                           const ThresholdConfig &thresholds) {
        return {
            MakeSaturationBoost(thresholds.saturation_boost),
            MakeLuminanceCeiling(thresholds.max_accent_luminance),
            MakeContrastFloor(background, thresholds.min_accent_contrast, thresholds.contrast_floor_luminance),
        };
    }

    Color ApplyCorrections(const Color &accent, const std::vector<AccentTransform> &chain) {
        Color current = accent;
        for (const auto &stage : chain)
            current = stage(current);
        return current;
    }

    bool IsDarkBackground(const Color &background, const ThresholdConfig &thresholds) {
        return RelativeLuminance(background) < thresholds.background_luminance;
    }

    Palette DerivePalette(const ThemeColors &theme,
                          const ThresholdConfig &thresholds,
                          const FallbackColors &fallback) {
        const auto &slots = theme.palette;

        const Color foreground = Resolve(theme.foreground, slots, 7, fallback.foreground);
        const Color background = Resolve(theme.background, slots, 0, fallback.background);
        const Color selection = Resolve(theme.selection_background, slots, 8,
                                        Blend(background, foreground, kSelectionBlend));

        Palette out{};
        out.fg0 = foreground;
        out.bg1 = background;
        out.bg3 = selection;

        out.red = ResolveSlot(slots, 1, fallback.red);
        out.green = ResolveSlot(slots, 2, fallback.green);
        out.yellow = ResolveSlot(slots, 3, fallback.yellow);
        out.blue = ResolveSlot(slots, 4, fallback.blue);
        out.purple = ResolveSlot(slots, 5, fallback.purple);
        out.aqua = ResolveSlot(slots, 6, fallback.aqua);
        out.orange = Blend(out.red, out.yellow, kOrangeBlend);

        if (IsDarkBackground(background, thresholds)) {
            const auto chain = BuildDarkThemeCorrections(background, thresholds);
            for (Color Palette::*accent : {&Palette::red, &Palette::green, &Palette::yellow,
                                           &Palette::blue, &Palette::purple, &Palette::aqua,
                                           &Palette::orange}) {
                out.*accent = ApplyCorrections(out.*accent, chain);
            }
        }

        const std::vector<Color> candidates = {foreground, background, kWhite, kBlack};
        out.on_bg1 = BestContrastText(background, candidates);
        out.on_bg3 = BestContrastText(selection, candidates);
        out.on_blue = BestContrastText(out.blue, candidates);
        out.on_aqua = BestContrastText(out.aqua, candidates);
        out.on_green = BestContrastText(out.green, candidates);
        out.on_orange = BestContrastText(out.orange, candidates);
        out.on_purple = BestContrastText(out.purple, candidates);
        out.on_red = BestContrastText(out.red, candidates);
        out.on_yellow = BestContrastText(out.yellow, candidates);
        return out;
    }
} // namespace PSYNC::Color
