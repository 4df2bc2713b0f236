#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "Color/ColorCodec.h"
#include "Core/ThemeReader.h"

using PSYNC::Color::FormatHexColor;

namespace {

class ThemeReaderTests : public ::testing::Test {
protected:
    void SetUp() override {
        temp_root_ = std::filesystem::temp_directory_path() / "psync_theme_reader_tests";
        std::error_code ec;
        std::filesystem::remove_all(temp_root_, ec);
        std::filesystem::create_directories(temp_root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_root_, ec);
    }

    std::string WriteScript(const std::string &name, const std::string &body) {
        auto path = temp_root_ / name;
        {
            std::ofstream ofs(path, std::ios::binary);
            ofs << "#!/bin/sh\n" << body;
        }
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
        return path.string();
    }

    std::filesystem::path temp_root_;
};

TEST_F(ThemeReaderTests, ParsesRecognizedKeys) {
    const std::string text =
        "# generated\n"
        "font-family = JetBrains Mono\n"
        "foreground = #EBDBB2\n"
        "background = #1d2021\n"
        "selection-background = #665c54\n"
        "palette = 0=#1d2021\n"
        "palette = 1=#cc241d\n"
        "palette = 15 = #FBF1C7\n"
        "cursor-color = #ffffff\n";

    const auto theme = PSYNC::Core::ParseShowConfig(text);
    ASSERT_TRUE(theme.foreground.has_value());
    EXPECT_EQ(FormatHexColor(*theme.foreground), "#ebdbb2");
    ASSERT_TRUE(theme.background.has_value());
    EXPECT_EQ(FormatHexColor(*theme.background), "#1d2021");
    ASSERT_TRUE(theme.selection_background.has_value());
    EXPECT_EQ(FormatHexColor(*theme.selection_background), "#665c54");

    ASSERT_EQ(theme.palette.size(), 3u);
    EXPECT_EQ(FormatHexColor(theme.palette.at(0)), "#1d2021");
    EXPECT_EQ(FormatHexColor(theme.palette.at(1)), "#cc241d");
    EXPECT_EQ(FormatHexColor(theme.palette.at(15)), "#fbf1c7");
}

TEST_F(ThemeReaderTests, SkipsMalformedLines) {
    const std::string text =
        "\n"
        "   \n"
        "foreground\n"
        "foreground =\n"
        "Foreground = #ffffff\n"
        "background = not-a-color\n"
        "selection-background = #12345\n"
        "palette = x=#123456\n"
        "palette = 3=#12345g\n"
        "palette = 4=123456\n"
        "palette = 5\n"
        "palette = 99999999999=#123456\n"
        "= #123456\n";

    const auto theme = PSYNC::Core::ParseShowConfig(text);
    EXPECT_FALSE(theme.foreground.has_value());
    EXPECT_FALSE(theme.background.has_value());
    EXPECT_FALSE(theme.selection_background.has_value());
    EXPECT_TRUE(theme.palette.empty());
}

TEST_F(ThemeReaderTests, LaterLinesOverrideEarlierOnes) {
    const std::string text =
        "palette = 2=#111111\n"
        "background = #000000\n"
        "palette = 2=#222222\n"
        "background = #0a0a0a\n"
        "background = broken\n";

    const auto theme = PSYNC::Core::ParseShowConfig(text);
    ASSERT_TRUE(theme.background.has_value());
    EXPECT_EQ(FormatHexColor(*theme.background), "#0a0a0a");
    EXPECT_EQ(FormatHexColor(theme.palette.at(2)), "#222222");
}

TEST_F(ThemeReaderTests, HandlesIndentationAndCrlf) {
    const std::string text = "  foreground   =   #a89984  \r\n\tpalette=7=#a89984\r\n";

    const auto theme = PSYNC::Core::ParseShowConfig(text);
    ASSERT_TRUE(theme.foreground.has_value());
    EXPECT_EQ(FormatHexColor(*theme.foreground), "#a89984");
    EXPECT_EQ(FormatHexColor(theme.palette.at(7)), "#a89984");
}

TEST_F(ThemeReaderTests, EmptyOutputYieldsEmptyTheme) {
    const auto theme = PSYNC::Core::ParseShowConfig("");
    EXPECT_FALSE(theme.foreground.has_value());
    EXPECT_TRUE(theme.palette.empty());
}

TEST_F(ThemeReaderTests, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(PSYNC::Core::ShellQuote("ghostty"), "'ghostty'");
    EXPECT_EQ(PSYNC::Core::ShellQuote("/opt/my app/ghostty"), "'/opt/my app/ghostty'");
    EXPECT_EQ(PSYNC::Core::ShellQuote("it's"), "'it'\\''s'");
    EXPECT_EQ(PSYNC::Core::ShellQuote(""), "''");
}

TEST_F(ThemeReaderTests, RunShowConfigCapturesStdout) {
    const std::string script = WriteScript("fake-ghostty",
        "if [ \"$1\" != \"+show-config\" ]; then exit 9; fi\n"
        "echo 'background = #282828'\n"
        "echo 'palette = 1=#cc241d'\n"
        "echo 'noise on stderr' >&2\n");

    std::string out;
    ASSERT_EQ(PSYNC_RESULT_OK, PSYNC::Core::RunShowConfig(script, out));
    EXPECT_EQ(out, "background = #282828\npalette = 1=#cc241d\n");

    const auto theme = PSYNC::Core::ReadTheme(script);
    ASSERT_TRUE(theme.has_value());
    ASSERT_TRUE(theme->background.has_value());
    EXPECT_EQ(FormatHexColor(*theme->background), "#282828");
    EXPECT_EQ(FormatHexColor(theme->palette.at(1)), "#cc241d");
}

TEST_F(ThemeReaderTests, CommandPathWithSpacesIsQuoted) {
    std::filesystem::create_directories(temp_root_ / "dir with space");
    const std::string script = WriteScript("dir with space/ghostty", "echo 'foreground = #ffffff'\n");

    const auto theme = PSYNC::Core::ReadTheme(script);
    ASSERT_TRUE(theme.has_value());
    ASSERT_TRUE(theme->foreground.has_value());
    EXPECT_EQ(FormatHexColor(*theme->foreground), "#ffffff");
}

TEST_F(ThemeReaderTests, NonZeroExitIsUnavailable) {
    const std::string script = WriteScript("failing-ghostty",
        "echo 'background = #282828'\n"
        "exit 3\n");

    std::string out = "stale";
    EXPECT_EQ(PSYNC_RESULT_THEME_UNAVAILABLE, PSYNC::Core::RunShowConfig(script, out));
    EXPECT_TRUE(out.empty());
    EXPECT_FALSE(PSYNC::Core::ReadTheme(script).has_value());
}

TEST_F(ThemeReaderTests, MissingCommandIsUnavailable) {
    const std::string missing = (temp_root_ / "no-such-ghostty").string();
    std::string out;
    EXPECT_EQ(PSYNC_RESULT_THEME_UNAVAILABLE, PSYNC::Core::RunShowConfig(missing, out));
    EXPECT_EQ(PSYNC_RESULT_THEME_UNAVAILABLE, PSYNC::Core::RunShowConfig("", out));
    EXPECT_FALSE(PSYNC::Core::ReadTheme(missing).has_value());
}

TEST_F(ThemeReaderTests, SuccessfulRunWithNoColorsStillYieldsTheme) {
    const std::string script = WriteScript("quiet-ghostty", "echo 'font-size = 13'\n");

    const auto theme = PSYNC::Core::ReadTheme(script);
    ASSERT_TRUE(theme.has_value());
    EXPECT_FALSE(theme->foreground.has_value());
    EXPECT_TRUE(theme->palette.empty());
}

} // namespace
