#include "TableLocator.h"
#include "CellNormalizer.h"

#include <algorithm>
#include <optional>

bool TableLocator::hasQuintileSequence(const RawGrid& grid, size_t row, const std::vector<std::string>& labels) {
    if (labels.empty() || labels.size() > grid.colCount()) return false;
    for (size_t start = 0; start + labels.size() <= grid.colCount(); ++start) {
        bool match = true;
        for (size_t k = 0; k < labels.size(); ++k) {
            if (RawGrid::cellText(grid.at(row, start + k)) != labels[k]) {
                match = false;
                break;
            }
        }
        if (match) return true;
    }
    return false;
}

size_t TableLocator::nonEmptyCellCount(const RawGrid& grid, size_t row) {
    size_t count = 0;
    for (size_t c = 0; c < grid.colCount(); ++c) {
        if (!RawGrid::isEmptyCell(grid.at(row, c))) ++count;
    }
    return count;
}

bool TableLocator::hasNumericCell(const RawGrid& grid, size_t row) {
    for (size_t c = 0; c < grid.colCount(); ++c) {
        if (CellNormalizer::normalizeCell(grid.at(row, c)).value.has_value()) return true;
    }
    return false;
}

Anchor TableLocator::detectAnchorRow(const RawGrid& grid, const AnchorRules& rules) {
    const size_t scanEnd = std::min(rules.maxScanRows, grid.rowCount());

    std::optional<size_t> headerThenData;
    for (size_t r = 0; r < scanEnd; ++r) {
        // The quintile row wins over any earlier header-then-data row: the title row above it also qualifies as one.
        if (hasQuintileSequence(grid, r, rules.quintileLabels)) {
            return Anchor{r, true, AnchorMethod::QUINTILE_LABELS};
        }
        if (!headerThenData && r + 1 < grid.rowCount() &&
            nonEmptyCellCount(grid, r) >= rules.minHeaderCells && hasNumericCell(grid, r + 1)) {
            headerThenData = r;
        }
    }

    if (headerThenData) return Anchor{*headerThenData, true, AnchorMethod::HEADER_THEN_DATA};
    return Anchor{rules.defaultRow, false, AnchorMethod::FALLBACK};
}

Anchor TableLocator::detectAnchorRow(const RawGrid& grid, size_t maxScanRows) {
    AnchorRules rules;
    rules.maxScanRows = maxScanRows;
    return detectAnchorRow(grid, rules);
}

const char* anchorMethodName(AnchorMethod method) {
    switch (method) {
        case AnchorMethod::QUINTILE_LABELS: return "quintile_labels";
        case AnchorMethod::HEADER_THEN_DATA: return "header_then_data";
        case AnchorMethod::FALLBACK: return "fallback";
    }
    return "unknown";
}
