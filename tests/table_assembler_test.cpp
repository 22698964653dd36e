#include "CellNormalizer.h"
#include "TableAssembler.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <random>

namespace {
std::vector<ColumnSpec> storeColumns() {
    return {
        {"special_shop", 1, ColumnRole::CATEGORY},
        {"supermarket_chain", 2, ColumnRole::CATEGORY},
        {"grocery", 3, ColumnRole::CATEGORY},
        {"other", 4, ColumnRole::CATEGORY},
        {"total", 5, ColumnRole::TOTAL},
    };
}

ClassifiedRow keptRow(size_t source, const std::string& label, RowLevel level, std::vector<std::optional<double>> values) {
    ClassifiedRow row;
    row.sourceRow = source;
    row.label = label;
    row.level = level;
    for (const auto& v : values) {
        NormalizedCell cell;
        cell.value = v;
        row.cells.push_back(cell);
    }
    return row;
}

ClassifiedRow droppedRow(size_t source, DropReason reason) {
    ClassifiedRow row;
    row.sourceRow = source;
    row.action = RowAction::DROP;
    row.reason = reason;
    return row;
}

AssemblyOptions percentOptions() {
    AssemblyOptions options;
    options.percentOfTotal = true;
    return options;
}
} // namespace

TEST(TableAssemblerTest, ErrorMarginRowAbsentFromTable) {
    std::vector<ClassifiedRow> rows = {
        keptRow(4, "Bread", RowLevel::SUBCATEGORY, {1.0, 2.0, 3.0, 4.0, 10.0}),
        droppedRow(5, DropReason::ERROR_MARGIN),
    };
    const AssemblyResult result = TableAssembler::assemble(rows, storeColumns(), AssemblyOptions{});
    ASSERT_EQ(result.table.rowCount(), 1u);
    EXPECT_EQ(result.table.rows()[0].label, "Bread");
    EXPECT_EQ(result.dropCounts.at(DropReason::ERROR_MARGIN), 1u);
}

TEST(TableAssemblerTest, ChecksumWithinToleranceRaisesNothing) {
    std::vector<ClassifiedRow> rows = {keptRow(1, "Dairy", RowLevel::SUBCATEGORY, {30.4, 51.1, 11.4, 6.0, 100.0})};
    const AssemblyResult result = TableAssembler::assemble(rows, storeColumns(), percentOptions());
    EXPECT_TRUE(result.issues.empty());
}

TEST(TableAssemblerTest, ChecksumBeyondToleranceIsNonBlockingWarning) {
    std::vector<ClassifiedRow> rows = {keptRow(1, "Dairy", RowLevel::SUBCATEGORY, {30.4, 51.1, 11.4, 1.0, 100.0})};
    const AssemblyResult result = TableAssembler::assemble(rows, storeColumns(), percentOptions());
    ASSERT_EQ(result.issues.size(), 1u);
    EXPECT_EQ(result.issues[0].kind, IssueKind::CHECKSUM_MISMATCH);
    EXPECT_EQ(result.issues[0].severity, IssueSeverity::WARNING);
    EXPECT_EQ(result.table.rowCount(), 1u);
}

TEST(TableAssemblerTest, ChecksumSkippedUnlessPercentOfTotal) {
    std::vector<ClassifiedRow> rows = {keptRow(1, "Dairy", RowLevel::SUBCATEGORY, {1.0, 1.0, 1.0, 1.0, 100.0})};
    EXPECT_TRUE(TableAssembler::assemble(rows, storeColumns(), AssemblyOptions{}).issues.empty());
}

TEST(TableAssemblerTest, AllEmptyRowDropped) {
    std::vector<ClassifiedRow> rows = {
        keptRow(1, "Spacer", RowLevel::SUBCATEGORY, {std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt}),
        keptRow(2, "Bread", RowLevel::SUBCATEGORY, {1.0, std::nullopt, std::nullopt, std::nullopt, 1.0}),
    };
    const AssemblyResult result = TableAssembler::assemble(rows, storeColumns(), AssemblyOptions{});
    ASSERT_EQ(result.table.rowCount(), 1u);
    EXPECT_EQ(result.dropCounts.at(DropReason::ALL_EMPTY), 1u);
}

TEST(TableAssemblerTest, RowFlagsAreUnionOfCellFlags) {
    ClassifiedRow row = keptRow(1, "Bread", RowLevel::SUBCATEGORY, {1.0, 2.0, 3.0, 4.0, 10.0});
    row.cells[0].flags.lowReliability = true;
    row.cells[2].flags.suppressed = true;
    const AssemblyResult result = TableAssembler::assemble({row}, storeColumns(), AssemblyOptions{});
    const CellFlags& flags = result.table.rows()[0].flags;
    EXPECT_TRUE(flags.lowReliability);
    EXPECT_TRUE(flags.suppressed);
    EXPECT_FALSE(flags.errorMargin);
}

TEST(TableAssemblerTest, DeterministicRegardlessOfInputOrder) {
    std::vector<ClassifiedRow> rows;
    for (size_t i = 0; i < 12; ++i) {
        if (i % 4 == 3) {
            rows.push_back(droppedRow(i, DropReason::FOOTNOTE));
        } else {
            rows.push_back(keptRow(i, "item " + std::to_string(i), i % 3 == 0 ? RowLevel::SECTION : RowLevel::DETAIL,
                                   {double(i), 1.0, 1.0, 1.0, double(i) + 3.0}));
        }
    }
    const AssemblyResult reference = TableAssembler::assemble(rows, storeColumns(), percentOptions());

    std::mt19937 rng(11);
    for (int round = 0; round < 4; ++round) {
        std::shuffle(rows.begin(), rows.end(), rng);
        const AssemblyResult again = TableAssembler::assemble(rows, storeColumns(), percentOptions());
        EXPECT_EQ(again.table, reference.table);
        EXPECT_EQ(again.dropCounts, reference.dropCounts);
    }
    for (size_t i = 1; i < reference.table.rowCount(); ++i) {
        EXPECT_LT(reference.table.rows()[i - 1].sourceRow, reference.table.rows()[i].sourceRow);
    }
}

TEST(NormalizedTableTest, SumColumnStaysWithinOneLevel) {
    std::vector<ClassifiedRow> rows = {
        keptRow(1, "Food", RowLevel::SECTION, {10.0, 10.0, 10.0, 10.0, 40.0}),
        keptRow(2, "Bread", RowLevel::SUBCATEGORY, {5.0, 5.0, 5.0, 5.0, 20.0}),
        keptRow(3, "Milk", RowLevel::SUBCATEGORY, {5.0, 5.0, 5.0, std::nullopt, 20.0}),
    };
    const NormalizedTable table = TableAssembler::assemble(rows, storeColumns(), AssemblyOptions{}).table;
    EXPECT_DOUBLE_EQ(table.sumColumn("total", RowLevel::SECTION), 40.0);
    EXPECT_DOUBLE_EQ(table.sumColumn("total", RowLevel::SUBCATEGORY), 40.0);
    EXPECT_DOUBLE_EQ(table.sumColumn("other", RowLevel::SUBCATEGORY), 5.0);
    EXPECT_EQ(table.rowsByLevel(RowLevel::SUBCATEGORY).size(), 2u);
    EXPECT_EQ(table.rowsByLevel(RowLevel::DETAIL).size(), 0u);
    EXPECT_EQ(table.totalColumnIndex(), 4);
    EXPECT_THROW(table.sumColumn("missing_column", RowLevel::SECTION), Survex::TableException);
}
