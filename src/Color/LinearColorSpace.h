#ifndef PSYNC_COLOR_LINEARCOLORSPACE_H
#define PSYNC_COLOR_LINEARCOLORSPACE_H

#include <cstdint>

#include "ColorCodec.h"

namespace PSYNC::Color {
    // Linear-light triple, only used mid-computation
    struct LinearRgb {
        double r{0.0};
        double g{0.0};
        double b{0.0};
    };

    constexpr double kLumaR = 0.2126;
    constexpr double kLumaG = 0.7152;
    constexpr double kLumaB = 0.0722;

    // sRGB <-> Linear conversions (component in [0,1])
    double SrgbToLinear(double c);
    double LinearToSrgb(double c);

    // Byte channel to linear light
    double DecodeChannel(uint8_t channel);

    // Linear light to byte. Input is clamped to [0,1]; rounding is half-to-even.
    uint8_t EncodeChannel(double value);

    LinearRgb Decode(const Color &color);
    Color Encode(const LinearRgb &linear);

    inline double Luminance(const LinearRgb &linear) {
        return kLumaR * linear.r + kLumaG * linear.g + kLumaB * linear.b;
    }

    double RelativeLuminance(const Color &color);

    // (L_lighter + 0.05) / (L_darker + 0.05); symmetric and >= 1
    double ContrastRatio(const Color &a, const Color &b);
} // namespace PSYNC::Color

#endif // PSYNC_COLOR_LINEARCOLORSPACE_H
