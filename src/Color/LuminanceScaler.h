#ifndef PSYNC_COLOR_LUMINANCESCALER_H
#define PSYNC_COLOR_LUMINANCESCALER_H

#include "ColorCodec.h"

namespace PSYNC::Color {
    // Below this luminance the hue is undefined and scaling is skipped.
    constexpr double kNearBlackLuminance = 0.001;

    /**
     * @brief Scale all linear channels so the color reaches the target luminance
     *
     * Chromaticity is kept. When the brightest channel would leave the gamut
     * the factor is reduced so that channel lands on 1.0 instead, which means
     * the target may not be reached for saturated colors.
     */
    Color ScaleToLuminance(const Color &color, double target);
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_LUMINANCESCALER_H
