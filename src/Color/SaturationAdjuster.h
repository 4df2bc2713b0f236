#ifndef PSYNC_COLOR_SATURATIONADJUSTER_H
#define PSYNC_COLOR_SATURATIONADJUSTER_H

#include "ColorCodec.h"
#include "LinearColorSpace.h"

namespace PSYNC::Color {
    // Y + (c - Y) * k for each linear channel
    LinearRgb ScaleChroma(const LinearRgb &linear, double luminance, double k);

    /**
     * @brief Raise saturation while keeping linear-light luminance fixed
     *
     * A factor <= 1 returns the color unchanged. Otherwise the largest chroma
     * scale in [1, factor] that keeps every channel inside [0,1] is used, so
     * the result never needs clamping.
     */
    Color BoostSaturation(const Color &color, double factor);
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_SATURATIONADJUSTER_H
