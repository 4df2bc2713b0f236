#include "LinearColorSpace.h"

#include <algorithm>
#include <cmath>

namespace PSYNC::Color {
    double SrgbToLinear(double c) {
        if (c <= 0.04045) return c / 12.92;
        return std::pow((c + 0.055) / 1.055, 2.4);
    }

    double LinearToSrgb(double c) {
        c = std::max(0.0, std::min(1.0, c));
        if (c <= 0.0031308) return c * 12.92;
        return 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
    }

    double DecodeChannel(uint8_t channel) {
        return SrgbToLinear(channel / 255.0);
    }

    uint8_t EncodeChannel(double value) {
        // nearbyint honours the default FE_TONEAREST mode: ties go to even
        const double scaled = std::nearbyint(LinearToSrgb(value) * 255.0);
        return static_cast<uint8_t>(std::clamp(scaled, 0.0, 255.0));
    }

    LinearRgb Decode(const Color &color) {
        return {DecodeChannel(color.r), DecodeChannel(color.g), DecodeChannel(color.b)};
    }

    Color Encode(const LinearRgb &linear) {
        return {EncodeChannel(linear.r), EncodeChannel(linear.g), EncodeChannel(linear.b)};
    }

    double RelativeLuminance(const Color &color) {
        return Luminance(Decode(color));
    }

    double ContrastRatio(const Color &a, const Color &b) {
        const double la = RelativeLuminance(a);
        const double lb = RelativeLuminance(b);
        const double lighter = std::max(la, lb);
        const double darker = std::min(la, lb);
        return (lighter + 0.05) / (darker + 0.05);
    }
} // namespace PSYNC::Color
