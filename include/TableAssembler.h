#pragma once

#include "NormalizedTable.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct AssemblyOptions {
    std::string labelColumn = "item";
    // Category columns are percentages of the row total; enables the checksum.
    bool percentOfTotal = false;
    double checksumTolerance = 2.0;
};

struct AssemblyResult {
    NormalizedTable table;
    std::vector<QualityIssue> issues;
    std::map<DropReason, size_t> dropCounts;
};

class TableAssembler {
public:
    /**
     * @brief Builds the immutable leveled table from classified rows.
     * @pre every row's cells are aligned with columns.
     * @post rows appear in source order; no kept row has every value empty.
     * Checksum deviations are reported as CHECKSUM_MISMATCH issues and never drop a row.
     */
    static AssemblyResult assemble(std::vector<ClassifiedRow> rows,
                                   const std::vector<ColumnSpec>& columns,
                                   const AssemblyOptions& options);

    /**
     * @brief |sum(category cells) - total| for a row, or nullopt when the row has no total.
     */
    static std::optional<double> checksumDeviation(const NormalizedRow& row, const std::vector<ColumnSpec>& columns);
};
