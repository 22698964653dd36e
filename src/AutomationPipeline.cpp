#include "AutomationPipeline.h"

#include "CSVUtils.h"
#include "CommonUtils.h"
#include "SurvexExceptions.h"
#include "TableExporter.h"

#include <algorithm>
#include <iostream>
#include <optional>

namespace {
std::string signedDelta(double v, int precision = 2) {
    return (v >= 0.0 ? "+" : "") + CommonUtils::formatNumber(v, precision);
}

std::string signedCount(size_t before, size_t after) {
    const long long d = static_cast<long long>(after) - static_cast<long long>(before);
    return (d >= 0 ? "+" : "") + std::to_string(d);
}

std::string describeAction(const CleaningAction& a) {
    std::string out = std::string(actionKindName(a.kind));
    if (!a.column.empty()) out += " [" + a.column + "]";
    out += ": " + a.strategyUsed + ", " + std::to_string(a.affectedRowCount) + " rows";
    if (!a.detail.empty()) out += " (" + a.detail + ")";
    return out;
}

void logAssessment(const char* label, const QualityAssessment& a) {
    std::cout << "[Survex][Quality] " << label << ": rows=" << a.rowCount
              << " missing=" << a.totalMissing
              << " duplicates=" << a.duplicateRows.size()
              << " score=" << CommonUtils::formatNumber(a.score.overall) << "/100\n";
}
} // namespace

QualityRun AutomationPipeline::runQuality(const TypedTable& table, const QualityConfig& config, bool verbose) {
    MissingOptions missing;
    missing.strategy = QualityCleaner::parseMissingStrategy(config.missingStrategy);
    missing.requiredColumns = config.requiredColumns;
    missing.fillDefaults = config.fillDefaults;

    DuplicateOptions duplicates;
    duplicates.keep = QualityCleaner::parseKeepPolicy(config.keep);

    OutlierOptions outliers;
    outliers.method = QualityCleaner::parseOutlierMethod(config.outlierMethod);
    outliers.columns = config.outlierColumns;
    outliers.multiplier = config.outlierMultiplier;

    QualityRun run;
    run.keyColumns = config.duplicateKeyColumns.empty() ? defaultKeyColumns(table, config.identifierColumn)
                                                        : config.duplicateKeyColumns;
    duplicates.keyColumns = run.keyColumns;

    AnalysisOptions analysis;
    analysis.keyColumns = run.keyColumns;
    analysis.outlierColumns = config.outlierColumns;
    analysis.multiplier = config.outlierMultiplier;

    run.before = QualityAnalyzer::analyze(table, analysis);
    logAssessment("Before cleaning", run.before);

    CleaningPipeline pipeline(table);
    if (!config.skipMissing) pipeline.handleMissing(missing);
    if (!config.skipDuplicates) pipeline.removeDuplicates(duplicates);
    if (!config.skipOutliers) pipeline.handleOutliers(outliers);
    pipeline.finish();

    run.cleaned = pipeline.table();
    run.actions = pipeline.log();
    run.stage = pipeline.stage();
    if (verbose) {
        for (const auto& action : run.actions) std::cout << "[Survex][Quality] " << describeAction(action) << "\n";
    }
    if (run.cleaned.rowCount() == 0) {
        std::cout << "[Survex][Warning] Cleaning left no rows; ratio metrics report 0\n";
    }

    run.after = QualityAnalyzer::analyze(run.cleaned, analysis);
    logAssessment("After cleaning", run.after);
    return run;
}

ReportEngine AutomationPipeline::buildQualityReport(const AutoConfig& config,
                                                    const QualityRun& quality,
                                                    const ExtractionResult* extraction) {
    const auto& before = quality.before;
    const auto& after = quality.after;

    ReportEngine report;
    report.addTitle("Data Quality Report");
    report.addParagraph("**Source:** " + config.inputPath + " | **Mode:** " +
                        (config.mode == RunMode::EXTRACT ? "extract" : "quality"));

    if (extraction) {
        report.addSection("Extraction");
        report.addParagraph("Header row " + std::to_string(extraction->anchor.row) + " (" +
                            anchorMethodName(extraction->anchor.method) + ", " +
                            (extraction->anchor.confident ? "detected" : "default fallback") + ").");

        std::vector<std::vector<std::string>> dropRows;
        for (const auto& [reason, count] : extraction->assembly.dropCounts) {
            dropRows.push_back({dropReasonName(reason), std::to_string(count)});
        }
        if (dropRows.empty()) {
            report.addParagraph("No rows dropped.");
        } else {
            report.addTable("Dropped Rows", {"Reason", "Rows"}, dropRows);
        }

        std::vector<std::vector<std::string>> levelRows;
        for (const auto& [level, count] : extraction->assembly.table.levelCounts()) {
            levelRows.push_back({rowLevelName(level), std::to_string(count)});
        }
        report.addTable("Kept Rows by Level", {"Level", "Rows"}, levelRows);

        if (!extraction->assembly.issues.empty()) {
            std::vector<std::string> items;
            for (const auto& issue : extraction->assembly.issues) items.push_back(issue.detail);
            report.addParagraph("**Checksum mismatches** (tolerance " +
                                CommonUtils::formatNumber(config.extraction.checksumTolerance) + "):");
            report.addList(items, false);
        }
    }

    report.addSection("Executive Summary");
    report.addTable("Quality Improvement", {"Metric", "Before Cleaning", "After Cleaning", "Change"}, {
        {"**Total Rows**", std::to_string(before.rowCount), std::to_string(after.rowCount), signedCount(before.rowCount, after.rowCount)},
        {"**Quality Score**", CommonUtils::formatNumber(before.score.overall) + "/100", CommonUtils::formatNumber(after.score.overall) + "/100",
         signedDelta(after.score.overall - before.score.overall)},
        {"**Missing Values**", std::to_string(before.totalMissing), std::to_string(after.totalMissing), signedCount(before.totalMissing, after.totalMissing)},
        {"**Duplicates**", std::to_string(before.duplicateRows.size()), std::to_string(after.duplicateRows.size()),
         signedCount(before.duplicateRows.size(), after.duplicateRows.size())},
        {"**Completeness**", CommonUtils::formatNumber(before.score.completeness) + "%", CommonUtils::formatNumber(after.score.completeness) + "%",
         signedDelta(after.score.completeness - before.score.completeness) + "%"},
        {"**Uniqueness**", CommonUtils::formatNumber(before.score.uniqueness) + "%", CommonUtils::formatNumber(after.score.uniqueness) + "%",
         signedDelta(after.score.uniqueness - before.score.uniqueness) + "%"},
        {"**Validity**", CommonUtils::formatNumber(before.score.validity) + "%", CommonUtils::formatNumber(after.score.validity) + "%",
         signedDelta(after.score.validity - before.score.validity) + "%"},
    });

    report.addSection("Issues Detected (Before Cleaning)");
    if (before.missing.empty()) {
        report.addParagraph("No missing values detected.");
    } else {
        std::vector<std::vector<std::string>> rows;
        for (const auto& m : before.missing) {
            std::vector<std::string> samples;
            for (size_t r : m.sampleRows) samples.push_back(std::to_string(r));
            rows.push_back({m.column, std::to_string(m.count), CommonUtils::formatNumber(m.percentage) + "%", CommonUtils::joinList(samples)});
        }
        report.addTable("Missing Values", {"Column", "Missing Count", "Percentage", "Sample Rows"}, rows);
    }

    report.addParagraph("**Total duplicate rows:** " + std::to_string(before.duplicateRows.size()) + " (" +
                        (quality.keyColumns.empty() ? std::string("full-row comparison")
                                                    : "key: `" + CommonUtils::joinList(quality.keyColumns) + "`") + ")");

    if (before.outliers.empty()) {
        report.addParagraph("No outliers detected.");
    } else {
        const std::string method = "IQR (" + CommonUtils::formatNumber(config.quality.outlierMultiplier, 1) + "x)";
        std::vector<std::vector<std::string>> rows;
        for (const auto& o : before.outliers) {
            rows.push_back({o.column, std::to_string(o.rows.size()), CommonUtils::formatNumber(o.bounds.lower),
                            CommonUtils::formatNumber(o.bounds.upper), method});
        }
        report.addTable("Outliers", {"Column", "Outlier Count", "Lower Bound", "Upper Bound", "Method"}, rows);
    }

    report.addSection("Cleaning Actions Performed");
    std::vector<std::string> actions;
    for (const auto& a : quality.actions) actions.push_back(describeAction(a));
    if (actions.empty()) {
        report.addParagraph("No cleaning stages ran.");
    } else {
        report.addList(actions, true);
    }
    report.addParagraph(std::string("Final stage: `") + cleaningStageName(quality.stage) + "`");

    report.addSection("Quality Metrics (After Cleaning)");
    std::vector<std::vector<std::string>> completeness;
    const auto& cleaned = quality.cleaned;
    for (const auto& col : cleaned.columns()) {
        const size_t present = static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(0)));
        const double pct = cleaned.rowCount() == 0 ? 0.0 : 100.0 * static_cast<double>(present) / static_cast<double>(cleaned.rowCount());
        completeness.push_back({col.name, columnTypeName(col.type), std::to_string(present), CommonUtils::formatNumber(pct) + "%"});
    }
    report.addTable("Completeness by Column", {"Column", "Type", "Non-Null Count", "Completeness"}, completeness);

    if (cleaned.hasRowMeta()) {
        std::vector<std::vector<std::string>> levels;
        for (RowLevel level : {RowLevel::SECTION, RowLevel::SUBCATEGORY, RowLevel::DETAIL}) {
            levels.push_back({rowLevelName(level), std::to_string(cleaned.rowsByLevel(level).size())});
        }
        report.addTable("Rows by Level", {"Level", "Rows"}, levels);
        report.addParagraph("Aggregate one level at a time; section rows already include their subcategories.");
    }
    return report;
}

int AutomationPipeline::run(const AutoConfig& config) {
    std::optional<ExtractionResult> extraction;
    TypedTable table;

    if (config.mode == RunMode::EXTRACT) {
        std::cout << "[Survex][Load] Reading sheet " << config.inputPath << "\n";
        const RawGrid grid = CSVUtils::readGridFile(config.inputPath, config.delimiter);
        std::cout << "[Survex][Load] " << grid.rowCount() << " rows x " << grid.colCount() << " columns\n";
        extraction = ExtractionPipeline::run(grid, config.extraction, config.verbose);
        table = TypedTable::fromNormalized(extraction->assembly.table);
    } else {
        std::cout << "[Survex][Load] Reading table " << config.inputPath << "\n";
        table = TypedTable::fromCSV(config.inputPath, config.delimiter);
        std::cout << "[Survex][Load] " << table.rowCount() << " rows x " << table.colCount() << " columns\n";
        if (config.verbose) {
            for (const auto& col : table.columns()) {
                std::cout << "[Survex][Load] " << col.name << ": " << columnTypeName(col.type) << "\n";
            }
        }
    }

    const QualityRun quality = runQuality(table, config.quality, config.verbose);

    TableExporter::exportTable(quality.cleaned, config.resolvedOutputPath(), config.exportFormat, config.delimiter);

    if (!config.reportFile.empty()) {
        const ReportEngine report = buildQualityReport(config, quality, extraction ? &*extraction : nullptr);
        report.save(config.reportFile);
        std::cout << "[Survex][Report] Saved " << config.reportFile << "\n";
    }
    return 0;
}
