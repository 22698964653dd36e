#pragma once

#include "TypedTable.h"

#include <map>
#include <string>
#include <vector>

enum class MissingStrategy { SMART, DROP, FILL_DEFAULT };
enum class KeepPolicy { FIRST, LAST };
enum class OutlierMethod { CAP, REMOVE, FLAG };
enum class ActionKind { HANDLE_MISSING, REMOVE_DUPLICATES, HANDLE_OUTLIERS };

struct CleaningAction {
    ActionKind kind = ActionKind::HANDLE_MISSING;
    std::string column;
    size_t affectedRowCount = 0;
    std::string strategyUsed;
    std::string detail;
};

struct MissingOptions {
    MissingStrategy strategy = MissingStrategy::SMART;
    std::vector<std::string> requiredColumns;           // DROP; empty means every column
    std::map<std::string, std::string> fillDefaults;    // FILL_DEFAULT
};

struct DuplicateOptions {
    std::vector<std::string> keyColumns; // empty: full-row equality
    KeepPolicy keep = KeepPolicy::FIRST;
};

struct OutlierOptions {
    OutlierMethod method = OutlierMethod::CAP;
    std::vector<std::string> columns; // empty: every numeric column
    double multiplier = 1.5;
};

struct StageResult {
    TypedTable table;
    std::vector<CleaningAction> actions;
};

/**
 * @brief Pure cleaning stages: each takes a table and returns a new table plus its audit entries.
 * @details Options are validated before any row is read; invalid options throw
 * Survex::ConfigurationException and produce no partial result.
 * The returned table records the stage reached. A table already at or past a stage's
 * target passes through unchanged with a single "skipped" action, so cleaned output
 * is never cleaned twice.
 */
class QualityCleaner {
public:
    static constexpr double kUnknownThresholdPct = 50.0;
    static constexpr const char* kUnknownLabel = "Unknown";
    static constexpr const char* kOutlierFlagSuffix = "_is_outlier";

    static StageResult handleMissing(const TypedTable& table, const MissingOptions& options);
    static StageResult removeDuplicates(const TypedTable& table, const DuplicateOptions& options);

    /**
     * @brief Columns are processed in order; each column's fence comes from the table as left by the previous column.
     */
    static StageResult handleOutliers(const TypedTable& table, const OutlierOptions& options);

    static MissingStrategy parseMissingStrategy(const std::string& name);
    static KeepPolicy parseKeepPolicy(const std::string& name);
    static OutlierMethod parseOutlierMethod(const std::string& name);
};

/**
 * @brief Enforces Raw -> MissingHandled -> Deduplicated -> OutliersHandled -> Clean.
 * @details Stages may be skipped. A stage at or behind the stage the table already carries
 * is a no-op that records a "skipped" action. Earlier table values are never modified.
 */
class CleaningPipeline {
public:
    explicit CleaningPipeline(TypedTable raw);

    void handleMissing(const MissingOptions& options);
    void removeDuplicates(const DuplicateOptions& options);
    void handleOutliers(const OutlierOptions& options);
    void finish() noexcept { table_.setStage(CleaningStage::CLEAN); }

    CleaningStage stage() const noexcept { return table_.stage(); }
    const TypedTable& table() const noexcept { return table_; }
    const std::vector<CleaningAction>& log() const noexcept { return log_; }

private:
    TypedTable table_;
    std::vector<CleaningAction> log_;

    void commit(StageResult result);
};

const char* missingStrategyName(MissingStrategy strategy);
const char* keepPolicyName(KeepPolicy keep);
const char* outlierMethodName(OutlierMethod method);
const char* cleaningStageName(CleaningStage stage);
const char* actionKindName(ActionKind kind);
