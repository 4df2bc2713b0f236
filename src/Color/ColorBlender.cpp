#include "ColorBlender.h"

#include <algorithm>
#include <cmath>

namespace PSYNC::Color {
    namespace {
        uint8_t Mix(uint8_t a, uint8_t b, double amount) {
            const int delta = static_cast<int>(b) - static_cast<int>(a);
            const double value = std::nearbyint(static_cast<double>(a) + delta * amount);
            return static_cast<uint8_t>(std::clamp(value, 0.0, 255.0));
        }
    } // namespace

    Color Blend(const Color &a, const Color &b, double amount) {
        return {Mix(a.r, b.r, amount), Mix(a.g, b.g, amount), Mix(a.b, b.b, amount)};
    }
} // namespace PSYNC::Color
