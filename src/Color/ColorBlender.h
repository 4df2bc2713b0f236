#ifndef PSYNC_COLOR_COLORBLENDER_H
#define PSYNC_COLOR_COLORBLENDER_H

#include "ColorCodec.h"

namespace PSYNC::Color {
    /**
     * @brief Interpolate two colors per channel in gamma (byte) space
     *
     * channel = round(a + (b - a) * amount), ties to even. amount is expected
     * in [0,1]; results are clamped to the byte range.
     */
    Color Blend(const Color &a, const Color &b, double amount);
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_COLORBLENDER_H
