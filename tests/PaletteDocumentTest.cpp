#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PaletteDocument.h"
#include <filesystem>
#include <fstream>

using namespace testing;
using PSYNC::Core::PaletteDocument;

class PaletteDocumentTest : public Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "PaletteDocumentTest";
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        if (std::filesystem::exists(tempDir)) {
            std::filesystem::remove_all(tempDir);
        }
    }

    std::filesystem::path tempDir;

    std::string CreateTestFile(const std::string& filename, const std::string& content) {
        auto filePath = tempDir / filename;
        std::ofstream ofs(filePath, std::ios::binary);
        ofs << content;
        return filePath.string();
    }

    static std::string Apply(const std::string& text, const std::string& name, const PaletteDocument::Entries& entries) {
        PaletteDocument doc;
        EXPECT_TRUE(doc.ParseFromString(text));
        EXPECT_TRUE(doc.UpdatePaletteSection(name, entries));
        return doc.Render();
    }
};

// Construction and basic operations
TEST_F(PaletteDocumentTest, ConstructorInitializesCorrectly) {
    PaletteDocument doc;

    EXPECT_TRUE(doc.IsEmpty());
    EXPECT_EQ(0u, doc.GetLineCount());
    EXPECT_TRUE(doc.IsStrictUtf8Validation());
    EXPECT_TRUE(doc.GetLastError().empty());
    EXPECT_EQ(PSYNC_RESULT_OK, doc.GetLastErrorCode());
}

TEST_F(PaletteDocumentTest, ClearResetsState) {
    PaletteDocument doc;
    doc.ParseFromString("[section]\nkey = 'value'");
    EXPECT_FALSE(doc.IsEmpty());

    doc.Clear();
    EXPECT_TRUE(doc.IsEmpty());
    EXPECT_EQ("\n", doc.Render());
}

// Parsing and rendering
TEST_F(PaletteDocumentTest, RenderNormalizesLineEndings) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("a = 1\r\nb = 2\rc = 3"));
    EXPECT_THAT(doc.GetLines(), ElementsAre("a = 1", "b = 2", "c = 3"));
    EXPECT_EQ("a = 1\nb = 2\nc = 3\n", doc.Render());
}

TEST_F(PaletteDocumentTest, RenderKeepsUntouchedLinesVerbatim) {
    const std::string text = "# comment  \n\n  indented = \"x\"\t\n[table]\n";
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString(text));
    EXPECT_EQ(text, doc.Render());
}

TEST_F(PaletteDocumentTest, ParseDropsByteOrderMark) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("\xEF\xBB\xBFpalette = 'x'\n"));
    EXPECT_EQ("palette = 'x'\n", doc.Render());
}

TEST_F(PaletteDocumentTest, StrictModeRejectsInvalidUtf8) {
    PaletteDocument doc;
    EXPECT_FALSE(doc.ParseFromString("name = '\xFF'\n"));
    EXPECT_EQ(PSYNC_RESULT_DOCUMENT_INVALID_UTF8, doc.GetLastErrorCode());
    EXPECT_FALSE(doc.GetLastError().empty());

    doc.SetStrictUtf8Validation(false);
    EXPECT_TRUE(doc.ParseFromString("name = '\xFF'\n"));
    EXPECT_EQ(PSYNC_RESULT_OK, doc.GetLastErrorCode());
    EXPECT_EQ(1u, doc.GetLineCount());
}

TEST_F(PaletteDocumentTest, ParseFromFile) {
    auto path = CreateTestFile("starship.toml", "format = \"$all\"\n[character]\n");

    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromFile(path));
    EXPECT_EQ(2u, doc.GetLineCount());

    EXPECT_FALSE(doc.ParseFromFile((tempDir / "missing.toml").string()));
    EXPECT_EQ(PSYNC_RESULT_IO_ERROR, doc.GetLastErrorCode());
    EXPECT_TRUE(doc.IsEmpty());
}

// Palette selection
TEST_F(PaletteDocumentTest, EnsureRewritesExistingSelection) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("palette = \"gruvbox\"\nx=1"));
    ASSERT_TRUE(doc.EnsurePaletteSelection("ghostty_dynamic"));
    EXPECT_EQ("palette = 'ghostty_dynamic'\nx=1\n", doc.Render());
}

TEST_F(PaletteDocumentTest, EnsureRewritesOnlyFirstSelection) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("palette='a'   \npalette = 'b'\n"));
    ASSERT_TRUE(doc.EnsurePaletteSelection("dyn"));
    EXPECT_THAT(doc.GetLines(), ElementsAre("palette = 'dyn'", "palette = 'b'"));
}

TEST_F(PaletteDocumentTest, EnsureIgnoresNonMatchingPaletteLines) {
    // Indented, unquoted, empty and trailing-comment forms are not selections
    const std::string text =
        "  palette = 'indented'\n"
        "palette = bare\n"
        "palette = ''\n"
        "palette = 'x' # note\n"
        "palettes = 'other'\n"
        "[git_branch]\n";
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString(text));
    ASSERT_TRUE(doc.EnsurePaletteSelection("dyn"));

    const auto& lines = doc.GetLines();
    ASSERT_EQ(8u, lines.size());
    EXPECT_EQ("palettes = 'other'", lines[4]);
    EXPECT_EQ("palette = 'dyn'", lines[5]);
    EXPECT_EQ("", lines[6]);
    EXPECT_EQ("[git_branch]", lines[7]);
}

TEST_F(PaletteDocumentTest, EnsureInsertsBeforeFirstTable) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("format = \"$all\"\n\n  [character]\nsymbol = '>'\n"));
    ASSERT_TRUE(doc.EnsurePaletteSelection("ghostty_dynamic"));
    EXPECT_EQ("format = \"$all\"\n\npalette = 'ghostty_dynamic'\n\n  [character]\nsymbol = '>'\n", doc.Render());
}

TEST_F(PaletteDocumentTest, EnsureAppendsWhenNoTables) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("format = \"$all\"\n"));
    ASSERT_TRUE(doc.EnsurePaletteSelection("ghostty_dynamic"));
    EXPECT_EQ("format = \"$all\"\npalette = 'ghostty_dynamic'\n\n", doc.Render());
}

TEST_F(PaletteDocumentTest, EnsureOnEmptyDocument) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString(""));
    ASSERT_TRUE(doc.EnsurePaletteSelection("ghostty_dynamic"));
    EXPECT_EQ("palette = 'ghostty_dynamic'\n\n", doc.Render());
}

TEST_F(PaletteDocumentTest, EnsureRejectsInvalidName) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("x = 1\n"));
    EXPECT_FALSE(doc.EnsurePaletteSelection("bad name"));
    EXPECT_EQ(PSYNC_RESULT_DOCUMENT_INVALID_NAME, doc.GetLastErrorCode());
    EXPECT_FALSE(doc.EnsurePaletteSelection(""));
    EXPECT_EQ("x = 1\n", doc.Render());
}

// Palette section updates
TEST_F(PaletteDocumentTest, EmptyTemplateGetsSelectionAndSection) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString(""));
    ASSERT_TRUE(doc.EnsurePaletteSelection("ghostty_dynamic"));
    ASSERT_TRUE(doc.UpdatePaletteSection("ghostty_dynamic", {{"a", "#000000"}, {"b", "#ffffff"}}));
    EXPECT_EQ("palette = 'ghostty_dynamic'\n\n[palettes.ghostty_dynamic]\na = '#000000'\nb = '#ffffff'\n",
              doc.Render());
}

TEST_F(PaletteDocumentTest, UpdateRewritesKnownKeysAndKeepsOthers) {
    const std::string text =
        "[palettes.dyn]\n"
        "  color_red = \"#000000\"\n"
        "# keep me\n"
        "custom = '#123456'\n"
        "color_blue='#111111'   \n"
        "\n"
        "[other]\n"
        "color_red = '#999999'\n";

    const std::string expected =
        "[palettes.dyn]\n"
        "  color_red = '#ff0000'\n"
        "# keep me\n"
        "custom = '#123456'\n"
        "color_blue = '#0000ff'\n"
        "\n"
        "color_green = '#00ff00'\n"
        "[other]\n"
        "color_red = '#999999'\n";

    EXPECT_EQ(expected, Apply(text, "dyn", {{"color_red", "#ff0000"}, {"color_green", "#00ff00"}, {"color_blue", "#0000ff"}}));
}

TEST_F(PaletteDocumentTest, UpdateLeavesNonMatchingEntryForms) {
    const std::string text =
        "[palettes.dyn]\n"
        "color_red = #000000\n"
        "color-blue = '#000000'\n"
        "color_green = '#000000' # trailing\n";

    const std::string rendered = Apply(text, "dyn", {{"color_red", "#ff0000"}, {"color_green", "#00ff00"}});
    EXPECT_EQ(
        "[palettes.dyn]\n"
        "color_red = #000000\n"
        "color-blue = '#000000'\n"
        "color_green = '#000000' # trailing\n"
        "color_red = '#ff0000'\n"
        "color_green = '#00ff00'\n",
        rendered);
}

TEST_F(PaletteDocumentTest, UpdateAcceptsEmptyQuotedValue) {
    EXPECT_EQ("[palettes.dyn]\nk = 'v'\n", Apply("[palettes.dyn]\nk = ''\n", "dyn", {{"k", "v"}}));
}

TEST_F(PaletteDocumentTest, UpdateCreatesMissingSection) {
    EXPECT_EQ("x = 1\n\n[palettes.dyn]\nk = 'v'\n", Apply("x = 1\n", "dyn", {{"k", "v"}}));
    // An existing trailing blank line is reused as the separator
    EXPECT_EQ("x = 1\n\n[palettes.dyn]\nk = 'v'\n", Apply("x = 1\n\n", "dyn", {{"k", "v"}}));
    EXPECT_EQ("x = 1\n  \n[palettes.dyn]\nk = 'v'\n", Apply("x = 1\n  \n", "dyn", {{"k", "v"}}));
}

TEST_F(PaletteDocumentTest, UpdateMatchesHeaderAfterTrimming) {
    EXPECT_EQ("  [palettes.dyn]  \nk = 'v'\n", Apply("  [palettes.dyn]  \n", "dyn", {{"k", "v"}}));
}

TEST_F(PaletteDocumentTest, UpdateDoesNotMatchOtherPalettes) {
    const std::string text = "[palettes.dyn_other]\nk = 'old'\n";
    EXPECT_EQ("[palettes.dyn_other]\nk = 'old'\n\n[palettes.dyn]\nk = 'v'\n", Apply(text, "dyn", {{"k", "v"}}));
}

TEST_F(PaletteDocumentTest, DuplicateSectionsShareSeenKeys) {
    const std::string text =
        "[palettes.dyn]\n"
        "a = '1'\n"
        "[mid]\n"
        "[palettes.dyn]\n"
        "b = '2'\n";

    const std::string expected =
        "[palettes.dyn]\n"
        "a = 'A'\n"
        "b = 'B'\n"
        "[mid]\n"
        "[palettes.dyn]\n"
        "b = 'B'\n";

    EXPECT_EQ(expected, Apply(text, "dyn", {{"a", "A"}, {"b", "B"}}));
}

TEST_F(PaletteDocumentTest, UpdateRejectsInvalidInput) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString("x = 1\n"));

    EXPECT_FALSE(doc.UpdatePaletteSection("a.b", {{"k", "v"}}));
    EXPECT_EQ(PSYNC_RESULT_DOCUMENT_INVALID_NAME, doc.GetLastErrorCode());

    EXPECT_FALSE(doc.UpdatePaletteSection("dyn", {{"bad-key", "v"}}));
    EXPECT_EQ(PSYNC_RESULT_DOCUMENT_INVALID_NAME, doc.GetLastErrorCode());

    EXPECT_FALSE(doc.UpdatePaletteSection("dyn", {{"k", "it's"}}));
    EXPECT_EQ(PSYNC_RESULT_INVALID_ARGUMENT, doc.GetLastErrorCode());

    EXPECT_EQ("x = 1\n", doc.Render());
}

TEST_F(PaletteDocumentTest, UpdateIsIdempotent) {
    const PaletteDocument::Entries entries = {{"color_red", "#e61500"}, {"color_blue", "#1b888c"}};
    const std::string once = Apply("[palettes.dyn]\ncolor_red = '#000000'\n[x]\n", "dyn", entries);
    EXPECT_EQ(once, Apply(once, "dyn", entries));
}

// Section lookup
TEST_F(PaletteDocumentTest, FindSectionReportsEveryOccurrence) {
    PaletteDocument doc;
    ASSERT_TRUE(doc.ParseFromString(
        "top = 1\n"
        "[palettes.dyn]\n"
        "a = '1'\n"
        "[mid]\n"
        "m = 2\n"
        "[palettes.dyn]\n"
        "b = '2'\n"));

    auto spans = doc.FindSection("dyn");
    ASSERT_EQ(2u, spans.size());
    EXPECT_EQ(1u, spans[0].header);
    EXPECT_EQ(3u, spans[0].end);
    EXPECT_EQ(5u, spans[1].header);
    EXPECT_EQ(7u, spans[1].end);

    EXPECT_TRUE(doc.FindSection("missing").empty());
}

TEST_F(PaletteDocumentTest, FormattingHelpers) {
    EXPECT_EQ("[palettes.ghostty_dynamic]", PaletteDocument::MakeSectionHeader("ghostty_dynamic"));
    EXPECT_EQ("  key = '#abcdef'", PaletteDocument::FormatEntry("  ", "key", "#abcdef"));
}
