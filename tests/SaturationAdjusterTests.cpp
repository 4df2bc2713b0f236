#include <gtest/gtest.h>

#include "Color/ColorCodec.h"
#include "Color/LinearColorSpace.h"
#include "Color/SaturationAdjuster.h"

using namespace PSYNC::Color;

namespace {

Color Hex(const char *text) {
    auto color = ParseHexColor(text);
    EXPECT_TRUE(color.has_value()) << text;
    return color.value_or(Color{});
}

std::string Boost(const char *text, double factor) {
    return FormatHexColor(BoostSaturation(Hex(text), factor));
}

TEST(SaturationAdjusterTests, DefaultDarkThemeBoost) {
    EXPECT_EQ(Boost("#cc241d", 1.35), "#d21200");
    EXPECT_EQ(Boost("#458588", 1.35), "#1b888c");
    EXPECT_EQ(Boost("#98971a", 1.35), "#989700");
    EXPECT_EQ(Boost("#d79921", 1.35), "#d99800");
    EXPECT_EQ(Boost("#b16286", 1.35), "#c0578a");
    EXPECT_EQ(Boost("#689d6a", 1.35), "#54a157");
    EXPECT_EQ(Boost("#d25e1f", 1.35), "#d65b00");
}

TEST(SaturationAdjusterTests, LargerFactorStopsAtGamutEdge) {
    EXPECT_EQ(Boost("#458588", 2.0), "#00898d");
}

TEST(SaturationAdjusterTests, FactorAtOrBelowOneIsIdentity) {
    EXPECT_EQ(Boost("#458588", 1.0), "#458588");
    EXPECT_EQ(Boost("#458588", 0.5), "#458588");
    EXPECT_EQ(Boost("#458588", -3.0), "#458588");
}

TEST(SaturationAdjusterTests, GraysAndGamutCornersAreUnchanged) {
    EXPECT_EQ(Boost("#808080", 1.35), "#808080");
    EXPECT_EQ(Boost("#ffffff", 1.35), "#ffffff");
    EXPECT_EQ(Boost("#000000", 1.35), "#000000");
    EXPECT_EQ(Boost("#ff0000", 1.35), "#ff0000");
}

TEST(SaturationAdjusterTests, ScaleChromaKeepsLuminance) {
    const LinearRgb linear = Decode(Hex("#b16286"));
    const double y = Luminance(linear);
    const LinearRgb scaled = ScaleChroma(linear, y, 1.3);
    EXPECT_NEAR(Luminance(scaled), y, 1e-12);

    const LinearRgb same = ScaleChroma(linear, y, 1.0);
    EXPECT_DOUBLE_EQ(same.r, linear.r);
    EXPECT_DOUBLE_EQ(same.g, linear.g);
    EXPECT_DOUBLE_EQ(same.b, linear.b);
}

TEST(SaturationAdjusterTests, BoostedColorKeepsApproximateLuminance) {
    const Color input = Hex("#689d6a");
    const Color output = BoostSaturation(input, 1.35);
    EXPECT_NEAR(RelativeLuminance(output), RelativeLuminance(input), 0.01);
}

} // namespace
