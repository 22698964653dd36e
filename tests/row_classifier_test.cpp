#include "CellNormalizer.h"
#include "RowClassifier.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

namespace {
std::vector<NormalizedCell> cells(std::initializer_list<double> values) {
    std::vector<NormalizedCell> out;
    for (double v : values) out.push_back(CellNormalizer::normalizeCell(RawCell(v)));
    return out;
}

ClassifierRules rulesWithTotal(size_t idx) {
    ClassifierRules rules;
    rules.totalColumn = idx;
    return rules;
}
} // namespace

TEST(RowClassifierTest, ErrorMarginLabelIsDropped) {
    const Classification c = RowClassifier::classifyRow("\xC2\xB1 1.3 error", cells({1.3, 1.2}), ClassifierRules{});
    EXPECT_EQ(c.action, RowAction::DROP);
    EXPECT_EQ(c.reason, DropReason::ERROR_MARGIN);
    EXPECT_EQ(c.level, RowLevel::ERROR_MARGIN);
}

TEST(RowClassifierTest, ErrorMarginCellDropsRow) {
    std::vector<NormalizedCell> row = cells({1.0, 2.0});
    row.push_back(CellNormalizer::normalizeCell(RawCell(std::string("\xC2\xB1" "0.4"))));
    const Classification c = RowClassifier::classifyRow("Bread", row, ClassifierRules{});
    EXPECT_EQ(c.reason, DropReason::ERROR_MARGIN);
}

TEST(RowClassifierTest, TableTitlesAndAggregatesAreGarbage) {
    const ClassifierRules rules;
    for (const char* label : {"TABLE 1.1 - MONEY EXPENDITURE", "Table 12 continued", "TOTAL", "Sum", "total consumption",
                              "\xD7\xA1\xD7\x9A \xD7\x94\xD7\x9B\xD7\x9C"}) {
        const Classification c = RowClassifier::classifyRow(label, cells({1.0}), rules);
        EXPECT_EQ(c.reason, DropReason::GARBAGE) << label;
    }
}

TEST(RowClassifierTest, NumberedFootnoteDropped) {
    const Classification c = RowClassifier::classifyRow("(1) Including meals", cells({1.0}), ClassifierRules{});
    EXPECT_EQ(c.reason, DropReason::FOOTNOTE);
}

TEST(RowClassifierTest, BlankLabelDropped) {
    EXPECT_EQ(RowClassifier::classifyRow("", cells({1.0}), ClassifierRules{}).reason, DropReason::BLANK);
    EXPECT_EQ(RowClassifier::classifyRow("   ", cells({1.0}), ClassifierRules{}).reason, DropReason::BLANK);
}

TEST(RowClassifierTest, HierarchyLevels) {
    const ClassifierRules rules;
    EXPECT_EQ(RowClassifier::hierarchyLevel("Food", rules), RowLevel::SECTION);
    EXPECT_EQ(RowClassifier::hierarchyLevel("Food expenditure, excl. fruit and vegetables", rules), RowLevel::SECTION);
    EXPECT_EQ(RowClassifier::hierarchyLevel("Bread", rules), RowLevel::SUBCATEGORY);
    EXPECT_EQ(RowClassifier::hierarchyLevel("Rice, pasta", rules), RowLevel::DETAIL);
    EXPECT_EQ(RowClassifier::hierarchyLevel("one two three four five six seven", rules), RowLevel::DETAIL);
}

TEST(RowClassifierTest, MissingTotalDropsKeptRow) {
    std::vector<NormalizedCell> row = cells({1.0, 2.0});
    row.push_back(NormalizedCell{});
    const Classification c = RowClassifier::classifyRow("Bread", row, rulesWithTotal(2));
    EXPECT_EQ(c.action, RowAction::DROP);
    EXPECT_EQ(c.reason, DropReason::MISSING_TOTAL);
    EXPECT_EQ(c.level, RowLevel::SUBCATEGORY);
}

TEST(RowClassifierTest, InjectedVocabularyChangesMatching) {
    ClassifierRules rules;
    rules.sectionKeywords = {"beverages"};
    EXPECT_EQ(RowClassifier::hierarchyLevel("Beverages", rules), RowLevel::SECTION);
    EXPECT_EQ(RowClassifier::hierarchyLevel("Food", rules), RowLevel::SUBCATEGORY);
}

TEST(RowClassifierTest, OrderIndependent) {
    const ClassifierRules rules = rulesWithTotal(1);
    const std::vector<std::pair<std::string, std::vector<NormalizedCell>>> rows = {
        {"Food", cells({10.0, 20.0})},
        {"Bread", cells({1.0, 2.0})},
        {"Rice, pasta and cereals", cells({3.0, 4.0})},
        {"TOTAL", cells({5.0, 6.0})},
        {"(2) note", cells({1.0, 1.0})},
        {"", cells({1.0, 1.0})},
    };
    std::vector<Classification> expected;
    for (const auto& [label, c] : rows) expected.push_back(RowClassifier::classifyRow(label, c, rules));

    std::vector<size_t> order(rows.size());
    for (size_t i = 0; i < order.size(); ++i) order[i] = i;
    std::mt19937 rng(7);
    for (int round = 0; round < 5; ++round) {
        std::shuffle(order.begin(), order.end(), rng);
        for (size_t i : order) {
            EXPECT_EQ(RowClassifier::classifyRow(rows[i].first, rows[i].second, rules), expected[i]);
        }
    }
}
