#include "AutomationPipeline.h"
#include "CSVUtils.h"
#include "ExtractionPipeline.h"
#include "SurvexExceptions.h"
#include "TableExporter.h"
#include "test_util.h"

#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>

// =============================================================================
// CSV grid reading
// =============================================================================

TEST(CSVUtilsTest, GridKeepsBlankLinesAndSourceNotation) {
    std::istringstream in("\xEF\xBB\xBFTitle\n\nItem,5,4\n\"Bread, white\",\"1,234\",(5.2)\n");
    const RawGrid grid = CSVUtils::readGrid(in, ',');
    ASSERT_EQ(grid.rowCount(), 4u);
    EXPECT_EQ(RawGrid::cellText(grid.at(0, 0)), "Title");
    EXPECT_TRUE(RawGrid::isEmptyCell(grid.at(1, 0)));
    EXPECT_DOUBLE_EQ(std::get<double>(grid.at(2, 1)), 5.0);
    EXPECT_EQ(std::get<std::string>(grid.at(3, 0)), "Bread, white");
    EXPECT_EQ(std::get<std::string>(grid.at(3, 1)), "1,234");
    EXPECT_EQ(std::get<std::string>(grid.at(3, 2)), "(5.2)");
    EXPECT_EQ(grid.colCount(), 3u);
}

TEST(CSVUtilsTest, UnterminatedQuoteIsIOError) {
    std::istringstream in("a,b\n\"open,1\n");
    EXPECT_THROW(CSVUtils::readGrid(in, ','), Survex::IOException);
    EXPECT_THROW(CSVUtils::readGridFile("/nonexistent/sheet.csv", ','), Survex::IOException);
}

TEST(CSVUtilsTest, HeaderNormalization) {
    EXPECT_EQ(CSVUtils::normalizeHeader({" id ", "", "id"}), (std::vector<std::string>{"id", "column_2", "id_2"}));
}

// =============================================================================
// Extraction
// =============================================================================

TEST(ExtractionPipelineTest, SampleSheetEndToEnd) {
    const ExtractionResult result = ExtractionPipeline::run(sampleSheet(), ExtractionConfig{});
    EXPECT_EQ(result.anchor.row, 3u);

    ASSERT_EQ(result.columns.size(), 6u);
    EXPECT_EQ(result.columns.front().name, "Q5");
    EXPECT_EQ(result.columns.back().name, "Total");
    EXPECT_EQ(result.columns.back().role, ColumnRole::TOTAL);

    const NormalizedTable& table = result.assembly.table;
    ASSERT_EQ(table.rowCount(), 3u);
    EXPECT_EQ(table.rows()[0].level, RowLevel::SECTION);
    EXPECT_DOUBLE_EQ(*table.rows()[0].cells[0].value, 3120.5);
    EXPECT_EQ(table.rows()[1].label, "Bread");
    EXPECT_TRUE(table.rows()[1].flags.lowReliability);
    EXPECT_DOUBLE_EQ(*table.rows()[1].cells[2].value, 12.3);
    EXPECT_EQ(table.rows()[2].level, RowLevel::DETAIL);
    EXPECT_TRUE(table.rows()[2].flags.suppressed);

    const auto& drops = result.assembly.dropCounts;
    EXPECT_EQ(drops.at(DropReason::ERROR_MARGIN), 1u);
    EXPECT_EQ(drops.at(DropReason::MISSING_TOTAL), 1u);
    EXPECT_EQ(drops.at(DropReason::FOOTNOTE), 1u);
    EXPECT_EQ(drops.at(DropReason::GARBAGE), 1u);
    for (const auto& row : table.rows()) {
        for (const auto& cell : row.cells) {
            if (cell.value) EXPECT_GE(*cell.value, 0.0);
        }
    }
}

TEST(ExtractionPipelineTest, ColumnOverridesMustFitSheet) {
    ExtractionConfig config;
    config.columnNames = {"a", "b"};
    EXPECT_THROW(ExtractionPipeline::run(sampleSheet(), config), Survex::ConfigurationException);

    config.columnNames = {"q5", "q4", "q3", "q2", "q1", "all"};
    config.totalColumn = "all";
    const ExtractionResult result = ExtractionPipeline::run(sampleSheet(), config);
    EXPECT_EQ(result.assembly.table.totalColumnIndex(), 5);

    config.totalColumn = "grand total";
    EXPECT_THROW(ExtractionPipeline::run(sampleSheet(), config), Survex::ConfigurationException);
}

TEST(ExtractionPipelineTest, LeveledTableSurvivesTypedView) {
    const NormalizedTable table = ExtractionPipeline::run(sampleSheet(), ExtractionConfig{}).assembly.table;
    const TypedTable typed = TypedTable::fromNormalized(table);
    EXPECT_TRUE(typed.hasRowMeta());
    EXPECT_EQ(typed.colCount(), 7u);
    EXPECT_EQ(typed.column(0).name, "item");
    EXPECT_EQ(typed.rowsByLevel(RowLevel::SECTION), std::vector<size_t>{0});
    EXPECT_EQ(typed.toNormalizedTable(), table);
}

// =============================================================================
// Quality run, export and report
// =============================================================================

TEST(AutomationPipelineTest, QualityRunDoesNotModifyInput) {
    TypedTable table;
    table.addColumn(numericColumn("id", {1.0, 1.0, 2.0, 3.0, 4.0, 5.0}));
    table.addColumn(numericColumn("income", {10.0, 10.0, 12.0, std::nullopt, 13.0, 1000.0}));

    QualityConfig config;
    config.identifierColumn = "id";
    const QualityRun run = AutomationPipeline::runQuality(table, config);
    EXPECT_EQ(run.keyColumns, std::vector<std::string>{"id"});
    EXPECT_EQ(run.stage, CleaningStage::CLEAN);
    EXPECT_EQ(run.before.totalMissing, 1u);
    EXPECT_EQ(run.after.totalMissing, 0u);
    EXPECT_EQ(run.cleaned.rowCount(), 5u);
    EXPECT_GE(run.after.score.overall, run.before.score.overall);
    EXPECT_EQ(table.rowCount(), 6u);
    EXPECT_TRUE(table.isMissing(3, 1));
}

TEST(AutomationPipelineTest, CleaningCleanedOutputIsNoOp) {
    TypedTable table;
    table.addColumn(numericColumn("v", {0.0, 0.0, 0.0, 100.0, std::nullopt}));
    const QualityRun first = AutomationPipeline::runQuality(table, QualityConfig{});
    const QualityRun second = AutomationPipeline::runQuality(first.cleaned, QualityConfig{});
    EXPECT_EQ(numericValues(second.cleaned, "v"), numericValues(first.cleaned, "v"));
    EXPECT_EQ(second.cleaned.rowCount(), first.cleaned.rowCount());
    for (const auto& action : second.actions) EXPECT_EQ(action.affectedRowCount, 0u);
}

TEST(AutomationPipelineTest, SkippedStagesRecordNothing) {
    TypedTable table;
    table.addColumn(numericColumn("v", {1.0, std::nullopt}));
    QualityConfig config;
    config.skipMissing = true;
    config.skipDuplicates = true;
    config.skipOutliers = true;
    const QualityRun run = AutomationPipeline::runQuality(table, config);
    EXPECT_TRUE(run.actions.empty());
    EXPECT_EQ(run.after.totalMissing, 1u);
}

TEST(TableExporterTest, LeveledExportCarriesLevelAndFlags) {
    const TypedTable typed = TypedTable::fromNormalized(ExtractionPipeline::run(sampleSheet(), ExtractionConfig{}).assembly.table);
    TempFile out("", ".csv");
    TableExporter::writeCSV(typed, out.path());
    const std::string csv = readFile(out.path());
    EXPECT_EQ(csv.substr(0, csv.find('\n')), "item,Q5,Q4,Q3,Q2,Q1,Total,level,flags");
    EXPECT_NE(csv.find("Bread,150,140,12.3,120,110,130,subcategory,low_reliability"), std::string::npos);
    EXPECT_NE(csv.find(",,"), std::string::npos);
}

TEST(TableExporterTest, NoneWritesNothing) {
    const std::string path = "/tmp/survex_none_export_" + std::to_string(getpid()) + ".csv";
    const auto written = TableExporter::exportTable(TypedTable{}, path, "none");
    EXPECT_TRUE(written.empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(AutomationPipelineTest, ExtractRunWritesTableAndReport) {
    std::ostringstream sheet;
    sheet << "TABLE 1.1 - EXPENDITURE\n\n"
          << "Item,5,4,3,2,1,Total\n"
          << "Food,100,90,80,70,60,80\n"
          << "Bread,10,9,(8),7,6,8\n"
          << "\xC2\xB1 error,1,1,1,1,1,1\n"
          << "\"Milk, cheese and eggs\",20,18,16,14,12,16\n"
          << "(1) footnote,,,,,,\n";
    TempFile input(sheet.str(), ".csv");
    const std::string dir = "/tmp/survex_run_" + std::to_string(getpid());

    AutoConfig config;
    config.mode = RunMode::EXTRACT;
    config.inputPath = input.path();
    config.outputPath = dir + "/clean.csv";
    config.reportFile = dir + "/report.md";

    AutomationPipeline pipeline;
    EXPECT_EQ(pipeline.run(config), 0);

    const std::string csv = readFile(config.outputPath);
    EXPECT_NE(csv.find("Food,"), std::string::npos);
    EXPECT_EQ(csv.find("error"), std::string::npos);
    EXPECT_EQ(csv.find("footnote"), std::string::npos);

    const std::string report = readFile(config.reportFile);
    EXPECT_NE(report.find("# Data Quality Report"), std::string::npos);
    EXPECT_NE(report.find("Executive Summary"), std::string::npos);
    EXPECT_NE(report.find("quintile_labels"), std::string::npos);
    EXPECT_NE(report.find("Completeness by Column"), std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST(AutomationPipelineTest, MissingInputIsIOError) {
    AutoConfig config;
    config.mode = RunMode::QUALITY;
    config.inputPath = "/nonexistent/households.csv";
    AutomationPipeline pipeline;
    EXPECT_THROW(pipeline.run(config), Survex::IOException);
}

TEST(ReportEngineTest, TablesEscapePipesAndFoldLongBodies) {
    ReportEngine report;
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 125; ++i) rows.push_back({"row " + std::to_string(i), "a|b"});
    report.addTable("Rows", {"Name", "Value"}, rows);
    const std::string& body = report.body();
    EXPECT_NE(body.find("### Rows"), std::string::npos);
    EXPECT_NE(body.find("| row 0 | a\\|b |"), std::string::npos);
    EXPECT_NE(body.find("<summary>5 more rows</summary>"), std::string::npos);
    EXPECT_LT(body.find("| row 119 |"), body.find("<details>"));
    EXPECT_GT(body.find("| row 120 |"), body.find("<details>"));
}
