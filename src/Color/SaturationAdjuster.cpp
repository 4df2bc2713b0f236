#include "SaturationAdjuster.h"

#include "BoundedSearch.h"

namespace PSYNC::Color {
    namespace {
        bool InUnitRange(double v) {
            return v >= 0.0 && v <= 1.0;
        }
    } // namespace

    LinearRgb ScaleChroma(const LinearRgb &linear, double luminance, double k) {
        return {
            luminance + (linear.r - luminance) * k,
            luminance + (linear.g - luminance) * k,
            luminance + (linear.b - luminance) * k,
        };
    }

    Color BoostSaturation(const Color &color, double factor) {
        if (factor <= 1.0)
            return color;

        const LinearRgb linear = Decode(color);
        const double y = Luminance(linear);

        const double k = FindLargestSatisfying(1.0, factor, [&](double candidate) {
            const LinearRgb t = ScaleChroma(linear, y, candidate);
            return InUnitRange(t.r) && InUnitRange(t.g) && InUnitRange(t.b);
        });

        return Encode(ScaleChroma(linear, y, k));
    }
} // namespace PSYNC::Color
