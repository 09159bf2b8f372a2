#include <gtest/gtest.h>
#include "composer/commands/formatting.h"

using namespace composer;
using namespace composer::commands;

// =============================================================================
// Markdown wrap
// =============================================================================

TEST(FormattingTest, CollapsedCaretInsertsMarkersAroundCaret) {
    const EditResult r = applyMarkdownWrap("cat", SelectionRange{3, 3}, "**", "**");
    EXPECT_EQ(r.text, "cat****");
    EXPECT_EQ(r.selection, (SelectionRange{5, 5}));
}

TEST(FormattingTest, SelectionIsWrappedAndStaysSelected) {
    const EditResult r = applyMarkdownWrap("hello world", SelectionRange{6, 11}, "**", "**");
    EXPECT_EQ(r.text, "hello **world**");
    EXPECT_EQ(r.selection, (SelectionRange{6, 15}));
}

TEST(FormattingTest, AsymmetricMarkers) {
    const EditResult r = applyMarkdownWrap("see docs", SelectionRange{4, 8}, "[", "](url)");
    EXPECT_EQ(r.text, "see [docs](url)");
    EXPECT_EQ(r.selection, (SelectionRange{4, 15}));
}

TEST(FormattingTest, BackwardSelectionIsNormalized) {
    const EditResult r = applyMarkdownWrap("abc", SelectionRange{3, 0}, "_", "_");
    EXPECT_EQ(r.text, "_abc_");
    EXPECT_EQ(r.selection, (SelectionRange{0, 5}));
}

// =============================================================================
// Indentation
// =============================================================================

TEST(FormattingTest, CollapsedIndentInsertsSpaces) {
    const EditResult r = indentSelection("ab", SelectionRange{1, 1}, 4);
    EXPECT_EQ(r.text, "a    b");
    EXPECT_EQ(r.selection, (SelectionRange{5, 5}));
}

TEST(FormattingTest, IndentsEveryTouchedLine) {
    const EditResult r = indentSelection("one\ntwo", SelectionRange{0, 7}, 4);
    EXPECT_EQ(r.text, "    one\n    two");
    EXPECT_EQ(r.selection, (SelectionRange{4, 15}));
}

TEST(FormattingTest, IndentStartsAtLineOfSelectionStart) {
    const EditResult r = indentSelection("xx\nabc\ndef", SelectionRange{5, 10}, 4);
    EXPECT_EQ(r.text, "xx\n    abc\n    def");
    EXPECT_EQ(r.selection, (SelectionRange{7, 18}));
}

TEST(FormattingTest, IndentWidthIsConfigurable) {
    const EditResult r = indentSelection("a\nb", SelectionRange{0, 3}, 2);
    EXPECT_EQ(r.text, "  a\n  b");
}

// =============================================================================
// Normalization
// =============================================================================

TEST(FormattingTest, NormalizeSwapsAndClamps) {
    EXPECT_EQ(normalizeSelection("abc", 10, 2), (SelectionRange{2, 3}));
    EXPECT_EQ(normalizeSelection("abc", 1, 2), (SelectionRange{1, 2}));
}

TEST(FormattingTest, NormalizeSnapsToCodepointBoundary) {
    EXPECT_EQ(normalizeSelection("\xC3\xA9x", 1, 1), (SelectionRange{0, 0}));
    EXPECT_EQ(normalizeSelection("\xC3\xA9x", 1, 3), (SelectionRange{0, 3}));
}
