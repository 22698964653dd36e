#include "TableLocator.h"
#include "test_util.h"

#include <gtest/gtest.h>

namespace {
using S = std::string;
}

TEST(TableLocatorTest, QuintileLabelRowIsAnchor) {
    const Anchor anchor = TableLocator::detectAnchorRow(sampleSheet(), AnchorRules{});
    EXPECT_EQ(anchor.row, 3u);
    EXPECT_TRUE(anchor.confident);
    EXPECT_EQ(anchor.method, AnchorMethod::QUINTILE_LABELS);
}

TEST(TableLocatorTest, QuintileLabelsMatchNumbersAndStrings) {
    RawGrid grid({{S("title")}, {S("Item"), S("5"), 4.0, S("3"), 2.0, S("1")}, {S("Bread"), 1.0}});
    const Anchor anchor = TableLocator::detectAnchorRow(grid, 20);
    EXPECT_EQ(anchor.row, 1u);
    EXPECT_EQ(anchor.method, AnchorMethod::QUINTILE_LABELS);
}

TEST(TableLocatorTest, QuintileRowBeatsEarlierHeaderThenData) {
    RawGrid grid({
        {S("a"), S("b"), S("c"), S("d"), S("e")},
        {1.0, 2.0, 3.0, 4.0, 5.0},
        {S("Item"), 5.0, 4.0, 3.0, 2.0, 1.0},
        {S("Bread"), 1.0, 1.0, 1.0, 1.0, 1.0},
    });
    const Anchor anchor = TableLocator::detectAnchorRow(grid, 20);
    EXPECT_EQ(anchor.row, 2u);
    EXPECT_EQ(anchor.method, AnchorMethod::QUINTILE_LABELS);
}

TEST(TableLocatorTest, HeaderThenDataWhenNoQuintileLabels) {
    RawGrid grid({
        {S("Household survey 2022")},
        {S("Item"), S("Rural"), S("Urban"), S("North"), S("South")},
        {S("Bread"), 10.0, 20.0, 30.0, 40.0},
    });
    const Anchor anchor = TableLocator::detectAnchorRow(grid, 20);
    EXPECT_EQ(anchor.row, 1u);
    EXPECT_TRUE(anchor.confident);
    EXPECT_EQ(anchor.method, AnchorMethod::HEADER_THEN_DATA);
}

TEST(TableLocatorTest, FallbackWhenNothingQualifies) {
    RawGrid grid({{S("only text")}, {S("more text")}});
    AnchorRules rules;
    rules.defaultRow = 7;
    const Anchor anchor = TableLocator::detectAnchorRow(grid, rules);
    EXPECT_EQ(anchor.row, 7u);
    EXPECT_FALSE(anchor.confident);
    EXPECT_EQ(anchor.method, AnchorMethod::FALLBACK);
}

TEST(TableLocatorTest, RowsBeyondScanWindowAreIgnored) {
    RawGrid grid({{S("x")}, {S("y")}, {S("Item"), 5.0, 4.0, 3.0, 2.0, 1.0}});
    const Anchor anchor = TableLocator::detectAnchorRow(grid, 2);
    EXPECT_EQ(anchor.method, AnchorMethod::FALLBACK);
}

TEST(TableLocatorTest, EmptyGridFallsBack) {
    const Anchor anchor = TableLocator::detectAnchorRow(RawGrid{}, 20);
    EXPECT_FALSE(anchor.confident);
}
