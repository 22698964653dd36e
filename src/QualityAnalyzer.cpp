#include "QualityAnalyzer.h"
#include "CommonUtils.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <unordered_set>

namespace {
std::vector<size_t> allColumns(const TypedTable& table) {
    std::vector<size_t> out(table.colCount());
    for (size_t i = 0; i < out.size(); ++i) out[i] = i;
    return out;
}

const TypedColumn& numericColumn(const TypedTable& table, const std::string& column) {
    const int idx = table.findColumnIndex(column);
    if (idx < 0) throw Survex::ConfigurationException("Unknown column: " + column);
    const auto& col = table.column(static_cast<size_t>(idx));
    if (col.type != ColumnType::NUMERIC) throw Survex::ConfigurationException("Column is not numeric: " + column);
    return col;
}

void requirePositiveMultiplier(double multiplier) {
    if (!(multiplier > 0.0) || !std::isfinite(multiplier)) {
        throw Survex::ConfigurationException("Outlier multiplier must be positive, got " + std::to_string(multiplier));
    }
}
} // namespace

double QualityAnalyzer::normalizeScore(double score) {
    if (!std::isfinite(score)) return 0.0;
    return std::max(0.0, std::min(100.0, score));
}

std::vector<size_t> QualityAnalyzer::resolveColumns(const TypedTable& table, const std::vector<std::string>& names) {
    if (names.empty()) return allColumns(table);
    std::vector<size_t> out;
    out.reserve(names.size());
    for (const auto& name : names) {
        const int idx = table.findColumnIndex(name);
        if (idx < 0) throw Survex::ConfigurationException("Unknown key column: " + name);
        out.push_back(static_cast<size_t>(idx));
    }
    return out;
}

std::vector<MissingSummary> QualityAnalyzer::detectMissing(const TypedTable& table) {
    std::vector<MissingSummary> out;
    const size_t rows = table.rowCount();
    for (const auto& col : table.columns()) {
        MissingSummary summary;
        summary.column = col.name;
        for (size_t r = 0; r < rows; ++r) {
            if (!col.missing[r]) continue;
            ++summary.count;
            if (summary.sampleRows.size() < kMissingSampleRows) summary.sampleRows.push_back(r);
        }
        if (summary.count == 0) continue;
        summary.percentage = 100.0 * static_cast<double>(summary.count) / static_cast<double>(rows);
        out.push_back(std::move(summary));
    }
    return out;
}

std::vector<size_t> QualityAnalyzer::detectDuplicates(const TypedTable& table, const std::vector<std::string>& keyColumns) {
    const auto columns = resolveColumns(table, keyColumns);
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t r = 0; r < table.rowCount(); ++r) groups[table.rowKey(r, columns)].push_back(r);

    std::vector<size_t> out;
    for (const auto& [key, rows] : groups) {
        if (rows.size() > 1) out.insert(out.end(), rows.begin(), rows.end());
    }
    std::sort(out.begin(), out.end());
    return out;
}

OutlierBounds QualityAnalyzer::computeBounds(const std::vector<double>& values, double multiplier) {
    requirePositiveMultiplier(multiplier);
    OutlierBounds b;
    if (values.empty()) return b;
    b.q1 = CommonUtils::quantileByNth(values, 0.25);
    b.q3 = CommonUtils::quantileByNth(values, 0.75);
    b.iqr = b.q3 - b.q1;
    b.lower = b.q1 - multiplier * b.iqr;
    b.upper = b.q3 + multiplier * b.iqr;
    return b;
}

OutlierReport QualityAnalyzer::outlierReport(const TypedTable& table, const std::string& column, double multiplier) {
    requirePositiveMultiplier(multiplier);
    const auto& col = numericColumn(table, column);
    const auto& values = std::get<std::vector<double>>(col.values);

    std::vector<double> present;
    present.reserve(values.size());
    for (size_t r = 0; r < table.rowCount(); ++r) {
        if (!col.missing[r]) present.push_back(values[r]);
    }

    OutlierReport report;
    report.column = column;
    if (present.empty()) return report;
    report.bounds = computeBounds(present, multiplier);
    for (size_t r = 0; r < table.rowCount(); ++r) {
        if (col.missing[r]) continue;
        if (values[r] < report.bounds.lower || values[r] > report.bounds.upper) report.rows.push_back(r);
    }
    return report;
}

std::vector<size_t> QualityAnalyzer::detectOutliers(const TypedTable& table, const std::string& column, double multiplier) {
    return outlierReport(table, column, multiplier).rows;
}

QualityScore QualityAnalyzer::computeQualityScore(const TypedTable& table,
                                                  const std::vector<std::string>& keyColumns,
                                                  double multiplier) {
    requirePositiveMultiplier(multiplier);
    const auto keys = resolveColumns(table, keyColumns);
    QualityScore score;
    const size_t rows = table.rowCount();
    if (rows == 0 || table.colCount() == 0) return score;

    size_t present = 0;
    for (const auto& col : table.columns()) {
        present += static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(0)));
    }
    const double totalCells = static_cast<double>(rows * table.colCount());

    std::unordered_set<std::string> distinct;
    for (size_t r = 0; r < rows; ++r) distinct.insert(table.rowKey(r, keys));

    std::set<size_t> outlierRows;
    for (size_t idx : table.numericColumnIndices()) {
        for (size_t r : detectOutliers(table, table.column(idx).name, multiplier)) outlierRows.insert(r);
    }

    score.completeness = normalizeScore(100.0 * static_cast<double>(present) / totalCells);
    score.uniqueness = normalizeScore(100.0 * static_cast<double>(distinct.size()) / static_cast<double>(rows));
    score.validity = normalizeScore(100.0 * static_cast<double>(rows - outlierRows.size()) / static_cast<double>(rows));
    score.overall = normalizeScore(kCompletenessWeight * score.completeness + kUniquenessWeight * score.uniqueness +
                                   kValidityWeight * score.validity);
    return score;
}

QualityAssessment QualityAnalyzer::analyze(const TypedTable& table, const AnalysisOptions& options) {
    QualityAssessment out;
    out.rowCount = table.rowCount();
    out.colCount = table.colCount();

    out.missing = detectMissing(table);
    for (const auto& m : out.missing) {
        out.totalMissing += m.count;
        QualityIssue issue;
        issue.kind = IssueKind::MISSING_VALUE;
        issue.column = m.column;
        issue.severity = m.percentage >= 50.0 ? IssueSeverity::ERROR : IssueSeverity::WARNING;
        issue.detail = std::to_string(m.count) + " missing (" + CommonUtils::formatNumber(m.percentage) + "%)";
        out.issues.push_back(std::move(issue));
    }

    out.duplicateRows = detectDuplicates(table, options.keyColumns);
    for (size_t r : out.duplicateRows) {
        QualityIssue issue;
        issue.kind = IssueKind::DUPLICATE;
        issue.column = CommonUtils::joinList(options.keyColumns);
        issue.row = r;
        issue.severity = IssueSeverity::WARNING;
        issue.detail = options.keyColumns.empty() ? "duplicate row" : "duplicate key";
        out.issues.push_back(std::move(issue));
    }

    std::vector<std::string> outlierColumns = options.outlierColumns;
    if (outlierColumns.empty()) {
        for (size_t idx : table.numericColumnIndices()) outlierColumns.push_back(table.column(idx).name);
    }
    for (const auto& column : outlierColumns) {
        auto report = outlierReport(table, column, options.multiplier);
        for (size_t r : report.rows) {
            QualityIssue issue;
            issue.kind = IssueKind::OUTLIER;
            issue.column = column;
            issue.row = r;
            issue.severity = IssueSeverity::INFO;
            issue.detail = "outside [" + CommonUtils::formatNumber(report.bounds.lower) + ", " +
                           CommonUtils::formatNumber(report.bounds.upper) + "]";
            out.issues.push_back(std::move(issue));
        }
        if (!report.rows.empty()) out.outliers.push_back(std::move(report));
    }

    out.score = computeQualityScore(table, options.keyColumns, options.multiplier);
    return out;
}

std::vector<std::string> defaultKeyColumns(const TypedTable& table, const std::string& identifierColumn) {
    if (!identifierColumn.empty() && table.findColumnIndex(identifierColumn) >= 0) return {identifierColumn};
    return {};
}
