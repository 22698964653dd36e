#include "NormalizedTable.h"
#include "CommonUtils.h"
#include "SurvexExceptions.h"

#include <utility>

NormalizedTable::NormalizedTable(std::string labelColumn, std::vector<ColumnSpec> columns, std::vector<NormalizedRow> rows)
    : labelColumn_(std::move(labelColumn)), columns_(std::move(columns)), rows_(std::move(rows)) {
    for (const auto& row : rows_) {
        if (row.cells.size() != columns_.size()) {
            throw Survex::TableException("Row '" + row.label + "' has " + std::to_string(row.cells.size()) +
                                         " cells, expected " + std::to_string(columns_.size()));
        }
    }
}

int NormalizedTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

int NormalizedTable::totalColumnIndex() const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].role == ColumnRole::TOTAL) return static_cast<int>(i);
    }
    return -1;
}

std::vector<const NormalizedRow*> NormalizedTable::rowsByLevel(RowLevel level) const {
    std::vector<const NormalizedRow*> out;
    for (const auto& row : rows_) {
        if (row.level == level) out.push_back(&row);
    }
    return out;
}

std::map<RowLevel, size_t> NormalizedTable::levelCounts() const {
    std::map<RowLevel, size_t> counts;
    for (const auto& row : rows_) counts[row.level]++;
    return counts;
}

double NormalizedTable::sumColumn(const std::string& column, RowLevel level) const {
    const int idx = findColumnIndex(column);
    if (idx < 0) throw Survex::TableException("Unknown column: " + column);
    double sum = 0.0;
    for (const auto& row : rows_) {
        if (row.level != level) continue;
        const auto& v = row.cells[static_cast<size_t>(idx)].value;
        if (v) sum += *v;
    }
    return sum;
}

const char* rowLevelName(RowLevel level) {
    switch (level) {
        case RowLevel::SECTION: return "section";
        case RowLevel::SUBCATEGORY: return "subcategory";
        case RowLevel::DETAIL: return "detail";
        case RowLevel::FOOTNOTE: return "footnote";
        case RowLevel::BLANK: return "blank";
        case RowLevel::ERROR_MARGIN: return "error_margin";
        case RowLevel::GARBAGE: return "garbage";
    }
    return "unknown";
}

const char* dropReasonName(DropReason reason) {
    switch (reason) {
        case DropReason::NONE: return "none";
        case DropReason::ERROR_MARGIN: return "error_margin";
        case DropReason::GARBAGE: return "garbage";
        case DropReason::FOOTNOTE: return "footnote";
        case DropReason::BLANK: return "blank";
        case DropReason::MISSING_TOTAL: return "missing_total";
        case DropReason::ALL_EMPTY: return "all_empty";
    }
    return "unknown";
}

const char* issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::MISSING_VALUE: return "missing_value";
        case IssueKind::DUPLICATE: return "duplicate";
        case IssueKind::OUTLIER: return "outlier";
        case IssueKind::CHECKSUM_MISMATCH: return "checksum_mismatch";
    }
    return "unknown";
}

const char* issueSeverityName(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::INFO: return "info";
        case IssueSeverity::WARNING: return "warning";
        case IssueSeverity::ERROR: return "error";
    }
    return "unknown";
}

std::string cellFlagsName(const CellFlags& flags) {
    std::vector<std::string> parts;
    if (flags.suppressed) parts.push_back("suppressed");
    if (flags.lowReliability) parts.push_back("low_reliability");
    if (flags.errorMargin) parts.push_back("error_margin");
    return CommonUtils::joinList(parts, "|");
}

bool isHierarchyLevel(RowLevel level) {
    return level == RowLevel::SECTION || level == RowLevel::SUBCATEGORY || level == RowLevel::DETAIL;
}

std::optional<RowLevel> parseRowLevel(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "section" || n == "0") return RowLevel::SECTION;
    if (n == "subcategory" || n == "1") return RowLevel::SUBCATEGORY;
    if (n == "detail" || n == "2") return RowLevel::DETAIL;
    return std::nullopt;
}
