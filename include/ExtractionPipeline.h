#pragma once

#include "AutoConfig.h"
#include "RawGrid.h"
#include "TableAssembler.h"
#include "TableLocator.h"

#include <vector>

struct ExtractionResult {
    Anchor anchor;
    std::vector<ColumnSpec> columns;
    std::vector<ClassifiedRow> classified; // source order, dropped rows included
    AssemblyResult assembly;
};

class ExtractionPipeline {
public:
    /**
     * @brief grid -> anchor -> per-row normalize + classify -> assembled leveled table.
     * @details Rows below the anchor are normalized and classified independently
     * (in parallel when built with OpenMP) into pre-sized slots.
     * @throws Survex::ConfigurationException when column_names or total_column do not fit the sheet.
     */
    static ExtractionResult run(const RawGrid& grid, const ExtractionConfig& config, bool verbose = false);

    /**
     * @brief Value columns right of the label column that yield at least one number below the anchor.
     * @details Quintile header labels become Q<label>; the total column is the one named
     * config.totalColumn, else the last value column.
     */
    static std::vector<ColumnSpec> resolveColumns(const RawGrid& grid, const Anchor& anchor, const ExtractionConfig& config);
};
