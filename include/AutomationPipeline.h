#pragma once

#include "AutoConfig.h"
#include "ExtractionPipeline.h"
#include "QualityAnalyzer.h"
#include "QualityCleaner.h"
#include "ReportEngine.h"
#include "TypedTable.h"

#include <vector>

struct QualityRun {
    QualityAssessment before;
    QualityAssessment after;
    TypedTable cleaned;
    std::vector<CleaningAction> actions;
    CleaningStage stage = CleaningStage::RAW;
    std::vector<std::string> keyColumns;
};

class AutomationPipeline final {
public:
    /**
     * @brief Loads the input, runs extraction (extract mode) and the quality stages, exports and reports.
     * @return 0 on completion.
     * @throws Survex::ConfigurationException before any output is written when options are invalid.
     * @throws Survex::IOException on unreadable input or unwritable output.
     */
    int run(const AutoConfig& config);

    /**
     * @brief Analyze, clean in stage order, analyze again. The input table is not modified.
     */
    static QualityRun runQuality(const TypedTable& table, const QualityConfig& config, bool verbose = false);

    static ReportEngine buildQualityReport(const AutoConfig& config,
                                           const QualityRun& quality,
                                           const ExtractionResult* extraction);
};
