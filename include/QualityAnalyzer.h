#pragma once

#include "NormalizedTable.h"
#include "TypedTable.h"

#include <string>
#include <vector>

struct MissingSummary {
    std::string column;
    size_t count = 0;
    double percentage = 0.0;
    std::vector<size_t> sampleRows; // first rows only
};

struct OutlierBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lower = 0.0;
    double upper = 0.0;
};

struct OutlierReport {
    std::string column;
    OutlierBounds bounds;
    std::vector<size_t> rows;
};

struct QualityScore {
    double completeness = 0.0;
    double uniqueness = 0.0;
    double validity = 0.0;
    double overall = 0.0;
};

struct AnalysisOptions {
    std::vector<std::string> keyColumns; // empty: full-row equality
    std::vector<std::string> outlierColumns; // empty: every numeric column
    double multiplier = 1.5;
};

struct QualityAssessment {
    size_t rowCount = 0;
    size_t colCount = 0;
    size_t totalMissing = 0;
    std::vector<MissingSummary> missing;
    std::vector<size_t> duplicateRows;
    std::vector<OutlierReport> outliers;
    QualityScore score;
    std::vector<QualityIssue> issues;
};

class QualityAnalyzer {
public:
    static constexpr size_t kMissingSampleRows = 10;
    static constexpr double kCompletenessWeight = 0.40;
    static constexpr double kUniquenessWeight = 0.30;
    static constexpr double kValidityWeight = 0.30;

    /**
     * @brief Missing-cell summary for every column that has missing cells, in column order.
     */
    static std::vector<MissingSummary> detectMissing(const TypedTable& table);

    /**
     * @brief Every row belonging to a group of two or more rows with equal key values, ascending.
     * @details Missing key cells compare equal to each other. Empty keyColumns compares full rows.
     * @throws Survex::ConfigurationException for an unknown key column.
     */
    static std::vector<size_t> detectDuplicates(const TypedTable& table, const std::vector<std::string>& keyColumns);

    /**
     * @brief IQR fence over the non-missing values of a numeric column.
     * @pre multiplier > 0.
     * @post returned rows hold values strictly below lower or strictly above upper.
     * @throws Survex::ConfigurationException for an unknown or non-numeric column, or multiplier <= 0.
     */
    static std::vector<size_t> detectOutliers(const TypedTable& table, const std::string& column, double multiplier = 1.5);
    static OutlierReport outlierReport(const TypedTable& table, const std::string& column, double multiplier = 1.5);

    /**
     * @brief Quartile fence for a sample; linear interpolation between closest ranks.
     * @throws Survex::ConfigurationException for multiplier <= 0.
     */
    static OutlierBounds computeBounds(const std::vector<double>& values, double multiplier);

    /**
     * @brief Weighted completeness/uniqueness/validity score, each clamped to [0, 100].
     * @post an empty table scores 0 on every metric.
     */
    static QualityScore computeQualityScore(const TypedTable& table,
                                            const std::vector<std::string>& keyColumns,
                                            double multiplier = 1.5);

    /**
     * @brief Runs every detector and collects issues. Repeatable; never mutates the table.
     */
    static QualityAssessment analyze(const TypedTable& table, const AnalysisOptions& options);

private:
    static double normalizeScore(double score);
    static std::vector<size_t> resolveColumns(const TypedTable& table, const std::vector<std::string>& names);
};

/**
 * @brief Key columns for duplicate detection: the identifier column when the table has it, else full row.
 */
std::vector<std::string> defaultKeyColumns(const TypedTable& table, const std::string& identifierColumn);
