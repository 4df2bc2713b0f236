#include "LuminanceScaler.h"

#include <algorithm>

#include "LinearColorSpace.h"

namespace PSYNC::Color {
    Color ScaleToLuminance(const Color &color, double target) {
        const LinearRgb linear = Decode(color);
        const double current = Luminance(linear);
        if (current < kNearBlackLuminance)
            return color;

        double factor = target / current;
        LinearRgb scaled{linear.r * factor, linear.g * factor, linear.b * factor};

        const double peak = std::max({scaled.r, scaled.g, scaled.b});
        if (peak > 1.0) {
            factor /= peak;
            scaled = {linear.r * factor, linear.g * factor, linear.b * factor};
        }

        return Encode(scaled);
    }
} // namespace PSYNC::Color
