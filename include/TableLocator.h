#pragma once

#include "RawGrid.h"

#include <cstddef>
#include <string>
#include <vector>

struct AnchorRules {
    // Rows [0, maxScanRows) are searched; metadata and titles sit above the header.
    size_t maxScanRows = 20;
    // Returned with confident=false when no row qualifies.
    size_t defaultRow = 7;
    size_t minHeaderCells = 5;
    std::vector<std::string> quintileLabels = {"5", "4", "3", "2", "1"};
};

enum class AnchorMethod { QUINTILE_LABELS, HEADER_THEN_DATA, FALLBACK };

struct Anchor {
    size_t row = 0;
    bool confident = false;
    AnchorMethod method = AnchorMethod::FALLBACK;
};

class TableLocator {
public:
    /**
     * @brief Finds the column-header row of a sheet with leading metadata rows.
     * @details A row carrying the quintile label sequence in adjacent cells wins when
     * present; otherwise the first row with >= minHeaderCells non-empty cells whose
     * next row holds a numeric cell. Earliest row wins within each heuristic.
     * @post Never throws; falls back to rules.defaultRow with confident=false.
     */
    static Anchor detectAnchorRow(const RawGrid& grid, const AnchorRules& rules);
    static Anchor detectAnchorRow(const RawGrid& grid, size_t maxScanRows);

    static bool hasQuintileSequence(const RawGrid& grid, size_t row, const std::vector<std::string>& labels);
    static size_t nonEmptyCellCount(const RawGrid& grid, size_t row);
    static bool hasNumericCell(const RawGrid& grid, size_t row);
};

const char* anchorMethodName(AnchorMethod method);
