#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct CellFlags {
    bool suppressed = false;
    bool lowReliability = false;
    bool errorMargin = false;

    bool any() const noexcept { return suppressed || lowReliability || errorMargin; }
    void merge(const CellFlags& other) noexcept {
        suppressed = suppressed || other.suppressed;
        lowReliability = lowReliability || other.lowReliability;
        errorMargin = errorMargin || other.errorMargin;
    }
    bool operator==(const CellFlags& other) const noexcept {
        return suppressed == other.suppressed && lowReliability == other.lowReliability &&
               errorMargin == other.errorMargin;
    }
    bool operator!=(const CellFlags& other) const noexcept { return !(*this == other); }
};

struct NormalizedCell {
    std::optional<double> value;
    CellFlags flags;

    bool operator==(const NormalizedCell& other) const noexcept {
        return value == other.value && flags == other.flags;
    }
};

enum class RowLevel { SECTION, SUBCATEGORY, DETAIL, FOOTNOTE, BLANK, ERROR_MARGIN, GARBAGE };
enum class RowAction { KEEP, DROP };
enum class DropReason { NONE, ERROR_MARGIN, GARBAGE, FOOTNOTE, BLANK, MISSING_TOTAL, ALL_EMPTY };

struct ClassifiedRow {
    size_t sourceRow = 0;
    std::string label;
    RowLevel level = RowLevel::SUBCATEGORY;
    RowAction action = RowAction::KEEP;
    DropReason reason = DropReason::NONE;
    std::vector<NormalizedCell> cells;
};

enum class ColumnRole { CATEGORY, TOTAL };

struct ColumnSpec {
    std::string name;
    size_t sourceIndex = 0;
    ColumnRole role = ColumnRole::CATEGORY;

    bool operator==(const ColumnSpec& other) const noexcept {
        return name == other.name && sourceIndex == other.sourceIndex && role == other.role;
    }
};

struct NormalizedRow {
    size_t sourceRow = 0;
    std::string label;
    RowLevel level = RowLevel::SUBCATEGORY;
    std::vector<NormalizedCell> cells; // aligned with NormalizedTable::columns()
    CellFlags flags;                   // union of the cell flags

    bool operator==(const NormalizedRow& other) const noexcept {
        return sourceRow == other.sourceRow && label == other.label && level == other.level &&
               cells == other.cells && flags == other.flags;
    }
};

enum class IssueKind { MISSING_VALUE, DUPLICATE, OUTLIER, CHECKSUM_MISMATCH };
enum class IssueSeverity { INFO, WARNING, ERROR };

struct QualityIssue {
    IssueKind kind = IssueKind::MISSING_VALUE;
    std::string column;
    std::optional<size_t> row;
    IssueSeverity severity = IssueSeverity::WARNING;
    std::string detail;
};

/**
 * @brief Leveled table of kept rows in source order. Immutable once constructed.
 * @details Aggregation goes through sumColumn(), which sums a single hierarchy
 * level so a section total is never added to its own subcategories.
 */
class NormalizedTable {
public:
    NormalizedTable() = default;
    NormalizedTable(std::string labelColumn, std::vector<ColumnSpec> columns, std::vector<NormalizedRow> rows);

    const std::string& labelColumn() const noexcept { return labelColumn_; }
    const std::vector<ColumnSpec>& columns() const noexcept { return columns_; }
    const std::vector<NormalizedRow>& rows() const noexcept { return rows_; }
    size_t rowCount() const noexcept { return rows_.size(); }
    size_t colCount() const noexcept { return columns_.size(); }

    /**
     * @brief Returns index of named value column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;
    int totalColumnIndex() const;

    std::vector<const NormalizedRow*> rowsByLevel(RowLevel level) const;
    std::map<RowLevel, size_t> levelCounts() const;

    /**
     * @brief Sums one value column over the rows of a single level; missing cells count as zero.
     * @throws Survex::TableException when the column does not exist.
     */
    double sumColumn(const std::string& column, RowLevel level) const;

    bool operator==(const NormalizedTable& other) const noexcept {
        return labelColumn_ == other.labelColumn_ && columns_ == other.columns_ && rows_ == other.rows_;
    }
    bool operator!=(const NormalizedTable& other) const noexcept { return !(*this == other); }

private:
    std::string labelColumn_ = "item";
    std::vector<ColumnSpec> columns_;
    std::vector<NormalizedRow> rows_;
};

const char* rowLevelName(RowLevel level);
const char* dropReasonName(DropReason reason);
const char* issueKindName(IssueKind kind);
const char* issueSeverityName(IssueSeverity severity);
std::string cellFlagsName(const CellFlags& flags);
bool isHierarchyLevel(RowLevel level);
std::optional<RowLevel> parseRowLevel(const std::string& name);
