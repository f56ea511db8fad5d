#include <gtest/gtest.h>
#include <gist/formatter.hpp>

using namespace gist;

// ============================================================================
// Elision
// ============================================================================

TEST(ElideTest, TruncatesWithEllipsis) {
    EXPECT_EQ(elide("0123456789", 8), "01234...");
}

TEST(ElideTest, ShortTextUnchanged) {
    EXPECT_EQ(elide("short", 80), "short");
}

TEST(ElideTest, ExactWidthUnchanged) {
    EXPECT_EQ(elide("0123456789", 10), "0123456789");
}

TEST(ElideTest, NoTerminalLeavesTextAlone) {
    std::string long_line(500, 'x');
    EXPECT_EQ(elide(long_line, std::nullopt), long_line);
}

TEST(ElideTest, WidthThreeIsOnlyEllipsis) {
    EXPECT_EQ(elide("0123456789", 3), "...");
}

TEST(ElideTest, DegenerateWidthsDoNotTruncate) {
    EXPECT_EQ(elide("0123456789", 2), "0123456789");
    EXPECT_EQ(elide("0123456789", 0), "0123456789");
}

TEST(ElideTest, ResultNeverExceedsWidth) {
    std::string text = "abcdefghijklmnopqrstuvwxyz";
    for (size_t width = 3; width < 40; ++width) {
        EXPECT_LE(elide(text, width).size(), width) << "width " << width;
    }
}

// ============================================================================
// Rendering
// ============================================================================

TEST(FormatTest, SummaryMarksVisibility) {
    EXPECT_EQ(format_summary({"aa11", true, std::string("public one")}), "aa11 + public one");
    EXPECT_EQ(format_summary({"bb22", false, std::string("secret one")}), "bb22 - secret one");
}

TEST(FormatTest, MissingDescriptionRendersEmpty) {
    EXPECT_EQ(format_summary({"cc33", true, std::nullopt}), "cc33 + ");
}

TEST(FormatTest, ListElidesEachLine) {
    std::vector<GistSummary> gists{
        {"aa11", true, std::string("a rather long description")},
        {"bb22", false, std::string("ok")},
    };
    EXPECT_EQ(format_list(gists, 12), "aa11 + a ...\nbb22 - ok\n");
    EXPECT_EQ(format_list(gists, std::nullopt),
              "aa11 + a rather long description\nbb22 - ok\n");
}

TEST(FormatTest, FilesOnePerLine) {
    EXPECT_EQ(format_files({"a.py", "b.sh"}), "a.py\nb.sh\n");
    EXPECT_EQ(format_files({}), "");
}

TEST(FormatTest, ContentHeadersEachFile) {
    std::map<std::string, std::string> files{
        {"a.txt", "alpha\n"},
        {"b.txt", "beta"},
    };
    EXPECT_EQ(format_content(files), "a.txt:\nalpha\n\nb.txt:\nbeta\n\n");
}
