#include "ExtractionPipeline.h"
#include "CSVUtils.h"
#include "CellNormalizer.h"
#include "CommonUtils.h"
#include "RowClassifier.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <iostream>

namespace {
constexpr size_t kLabelColumn = 0;

std::string headerName(const RawGrid& grid, size_t row, size_t col, const AnchorRules& rules) {
    const std::string text = RawGrid::cellText(grid.at(row, col));
    if (std::find(rules.quintileLabels.begin(), rules.quintileLabels.end(), text) != rules.quintileLabels.end()) {
        return "Q" + text;
    }
    return text;
}
} // namespace

std::vector<ColumnSpec> ExtractionPipeline::resolveColumns(const RawGrid& grid, const Anchor& anchor, const ExtractionConfig& config) {
    std::vector<size_t> valueCols;
    for (size_t c = kLabelColumn + 1; c < grid.colCount(); ++c) {
        for (size_t r = anchor.row + 1; r < grid.rowCount(); ++r) {
            if (CellNormalizer::normalizeCell(grid.at(r, c)).value) {
                valueCols.push_back(c);
                break;
            }
        }
    }

    std::vector<std::string> names;
    names.reserve(valueCols.size());
    for (size_t c : valueCols) {
        std::string name = headerName(grid, anchor.row, c, config.anchor);
        names.push_back(name.empty() ? "column_" + std::to_string(c + 1) : name);
    }
    names = CSVUtils::normalizeHeader(names);

    if (!config.columnNames.empty()) {
        if (config.columnNames.size() != valueCols.size()) {
            throw Survex::ConfigurationException("column_names lists " + std::to_string(config.columnNames.size()) +
                                                 " names but the sheet has " + std::to_string(valueCols.size()) +
                                                 " value columns");
        }
        names = CSVUtils::normalizeHeader(config.columnNames);
    }

    std::vector<ColumnSpec> specs;
    for (size_t i = 0; i < valueCols.size(); ++i) specs.push_back(ColumnSpec{names[i], valueCols[i], ColumnRole::CATEGORY});
    if (specs.empty()) return specs;

    if (config.totalColumn.empty()) {
        specs.back().role = ColumnRole::TOTAL;
        return specs;
    }
    const std::string wanted = CommonUtils::toLower(CommonUtils::trim(config.totalColumn));
    for (auto& spec : specs) {
        const std::string header = CommonUtils::toLower(RawGrid::cellText(grid.at(anchor.row, spec.sourceIndex)));
        if (CommonUtils::toLower(spec.name) == wanted || header == wanted) {
            spec.role = ColumnRole::TOTAL;
            return specs;
        }
    }
    throw Survex::ConfigurationException("total_column '" + config.totalColumn + "' not found among value columns");
}

ExtractionResult ExtractionPipeline::run(const RawGrid& grid, const ExtractionConfig& config, bool verbose) {
    ExtractionResult result;
    result.anchor = TableLocator::detectAnchorRow(grid, config.anchor);
    if (result.anchor.confident) {
        std::cout << "[Survex][Extract] Anchor row " << result.anchor.row << " ("
                  << anchorMethodName(result.anchor.method) << ")\n";
    } else {
        std::cout << "[Survex][Warning] No header row found in the first " << config.anchor.maxScanRows
                  << " rows; using default row " << result.anchor.row << "\n";
    }

    result.columns = resolveColumns(grid, result.anchor, config);
    if (result.columns.empty()) {
        std::cout << "[Survex][Warning] No numeric value columns below row " << result.anchor.row << "\n";
    } else if (verbose) {
        std::vector<std::string> names;
        for (const auto& spec : result.columns) {
            names.push_back(spec.role == ColumnRole::TOTAL ? spec.name + " (total)" : spec.name);
        }
        std::cout << "[Survex][Extract] Value columns: " << CommonUtils::joinList(names) << "\n";
    }

    ClassifierRules rules = config.classifier;
    rules.totalColumn.reset();
    for (size_t i = 0; i < result.columns.size(); ++i) {
        if (result.columns[i].role == ColumnRole::TOTAL) rules.totalColumn = i;
    }

    const size_t firstRow = std::min(result.anchor.row + 1, grid.rowCount());
    const size_t rowCount = grid.rowCount() - firstRow;
    result.classified.resize(rowCount);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t i = 0; i < rowCount; ++i) {
        const size_t sourceRow = firstRow + i;
        ClassifiedRow& row = result.classified[i];
        row.sourceRow = sourceRow;
        row.label = RawGrid::cellText(grid.at(sourceRow, kLabelColumn));
        row.cells.reserve(result.columns.size());
        for (const auto& spec : result.columns) {
            row.cells.push_back(CellNormalizer::normalizeCell(grid.at(sourceRow, spec.sourceIndex)));
        }
        const Classification cls = RowClassifier::classifyRow(row.label, row.cells, rules);
        row.level = cls.level;
        row.action = cls.action;
        row.reason = cls.reason;
    }

    if (verbose) {
        for (const auto& row : result.classified) {
            if (row.action != RowAction::DROP || row.reason == DropReason::BLANK) continue;
            std::cout << "[Survex][Extract] Dropped row " << row.sourceRow << " '" << row.label << "': "
                      << dropReasonName(row.reason) << "\n";
        }
    }

    AssemblyOptions options;
    options.labelColumn = config.labelColumn;
    options.percentOfTotal = config.percentOfTotal;
    options.checksumTolerance = config.checksumTolerance;
    result.assembly = TableAssembler::assemble(result.classified, result.columns, options);

    const auto& counts = result.assembly.dropCounts;
    size_t dropped = 0;
    std::vector<std::string> parts;
    for (const auto& [reason, count] : counts) {
        dropped += count;
        parts.push_back(std::string(dropReasonName(reason)) + "=" + std::to_string(count));
    }
    std::cout << "[Survex][Extract] Kept " << result.assembly.table.rowCount() << " of " << rowCount
              << " rows; dropped " << dropped << (parts.empty() ? "" : " (" + CommonUtils::joinList(parts) + ")")
              << "\n";
    for (const auto& issue : result.assembly.issues) {
        std::cout << "[Survex][Warning] " << issueKindName(issue.kind) << ": " << issue.detail << "\n";
    }
    return result;
}
