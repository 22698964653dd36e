#include "QualityCleaner.h"
#include "CommonUtils.h"
#include "QualityAnalyzer.h"
#include "RawGrid.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <map>
#include <optional>
#include <unordered_map>

namespace {
constexpr size_t kLoggedIdentifierLimit = 20;

size_t requireColumn(const TypedTable& table, const std::string& name) {
    const int idx = table.findColumnIndex(name);
    if (idx < 0) throw Survex::ConfigurationException("Unknown column: " + name);
    return static_cast<size_t>(idx);
}

void requirePositiveMultiplier(double multiplier) {
    if (!(multiplier > 0.0) || !std::isfinite(multiplier)) {
        throw Survex::ConfigurationException("Outlier multiplier must be positive, got " + std::to_string(multiplier));
    }
}

// Most frequent present value; ties go to the lexicographically smallest.
std::string modeOf(const std::vector<std::string>& values, const MissingMask& missing) {
    std::map<std::string, size_t> counts;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!missing[i]) counts[values[i]]++;
    }
    std::string best;
    size_t bestCount = 0;
    for (const auto& [value, count] : counts) {
        if (count > bestCount) {
            best = value;
            bestCount = count;
        }
    }
    return best;
}

size_t fillNumeric(TypedColumn& col, double value) {
    auto& values = std::get<std::vector<double>>(col.values);
    size_t filled = 0;
    for (size_t r = 0; r < col.missing.size(); ++r) {
        if (!col.missing[r]) continue;
        values[r] = value;
        col.missing[r] = 0;
        ++filled;
    }
    return filled;
}

size_t fillMissing(TypedColumn& col, const std::string& text) {
    size_t filled = 0;
    for (size_t r = 0; r < col.missing.size(); ++r) {
        if (!col.missing[r]) continue;
        if (col.type == ColumnType::NUMERIC) {
            double v = 0.0;
            const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
            if (ec != std::errc{} || p != text.data() + text.size()) continue;
            std::get<std::vector<double>>(col.values)[r] = v;
        } else if (col.type == ColumnType::BOOLEAN) {
            std::get<std::vector<uint8_t>>(col.values)[r] = CommonUtils::toLower(text) == "true" ? 1 : 0;
        } else {
            std::get<std::vector<std::string>>(col.values)[r] = text;
        }
        col.missing[r] = 0;
        ++filled;
    }
    return filled;
}

// Leveled tables hold survey values, which are never negative.
void validateFillDefault(const TypedColumn& col, const std::string& value, bool leveled) {
    if (col.type == ColumnType::NUMERIC) {
        double v = 0.0;
        const std::string t = CommonUtils::trim(value);
        const auto [p, ec] = std::from_chars(t.data(), t.data() + t.size(), v);
        if (t.empty() || ec != std::errc{} || p != t.data() + t.size() || !std::isfinite(v)) {
            throw Survex::ConfigurationException("Fill value for numeric column '" + col.name + "' is not a number: " + value);
        }
        if (leveled && v < 0.0) {
            throw Survex::ConfigurationException("Fill value for survey column '" + col.name + "' must not be negative: " + value);
        }
    } else if (col.type == ColumnType::BOOLEAN) {
        const std::string t = CommonUtils::toLower(CommonUtils::trim(value));
        if (t != "true" && t != "false") {
            throw Survex::ConfigurationException("Fill value for boolean column '" + col.name + "' must be true or false: " + value);
        }
    } else if (CommonUtils::trim(value).empty()) {
        throw Survex::ConfigurationException("Fill value for column '" + col.name + "' is empty");
    }
}

CleaningAction makeAction(ActionKind kind, std::string column, size_t count, std::string strategy, std::string detail) {
    CleaningAction a;
    a.kind = kind;
    a.column = std::move(column);
    a.affectedRowCount = count;
    a.strategyUsed = std::move(strategy);
    a.detail = std::move(detail);
    return a;
}

// A table already at or past the target stage passes through unchanged.
std::optional<StageResult> skipIfHandled(const TypedTable& table, CleaningStage target, ActionKind kind) {
    if (static_cast<int>(table.stage()) < static_cast<int>(target)) return std::nullopt;
    StageResult result{table, {}};
    result.actions.push_back(makeAction(kind, "", 0, "skipped",
                                        std::string("table already at stage ") + cleaningStageName(table.stage())));
    return result;
}
} // namespace

MissingStrategy QualityCleaner::parseMissingStrategy(const std::string& name) {
    const std::string m = CommonUtils::toLower(CommonUtils::trim(name));
    if (m == "smart") return MissingStrategy::SMART;
    if (m == "drop") return MissingStrategy::DROP;
    if (m == "fill_default" || m == "fill") return MissingStrategy::FILL_DEFAULT;
    throw Survex::ConfigurationException("Invalid missing-value strategy: " + name);
}

KeepPolicy QualityCleaner::parseKeepPolicy(const std::string& name) {
    const std::string m = CommonUtils::toLower(CommonUtils::trim(name));
    if (m == "first") return KeepPolicy::FIRST;
    if (m == "last") return KeepPolicy::LAST;
    throw Survex::ConfigurationException("Invalid duplicate keep policy: " + name);
}

OutlierMethod QualityCleaner::parseOutlierMethod(const std::string& name) {
    const std::string m = CommonUtils::toLower(CommonUtils::trim(name));
    if (m == "cap") return OutlierMethod::CAP;
    if (m == "remove") return OutlierMethod::REMOVE;
    if (m == "flag") return OutlierMethod::FLAG;
    throw Survex::ConfigurationException("Invalid outlier method: " + name);
}

StageResult QualityCleaner::handleMissing(const TypedTable& table, const MissingOptions& options) {
    if (auto skipped = skipIfHandled(table, CleaningStage::MISSING_HANDLED, ActionKind::HANDLE_MISSING)) return *skipped;
    StageResult result{table, {}};
    result.table.setStage(CleaningStage::MISSING_HANDLED);
    TypedTable& out = result.table;
    const std::string strategy = missingStrategyName(options.strategy);

    if (options.strategy == MissingStrategy::DROP) {
        std::vector<size_t> required;
        for (const auto& name : options.requiredColumns) required.push_back(requireColumn(table, name));
        if (options.requiredColumns.empty()) {
            for (size_t c = 0; c < table.colCount(); ++c) required.push_back(c);
        }

        MissingMask keep(out.rowCount(), static_cast<uint8_t>(1));
        size_t dropped = 0;
        for (size_t r = 0; r < out.rowCount(); ++r) {
            for (size_t c : required) {
                if (out.isMissing(r, c)) {
                    keep[r] = 0;
                    ++dropped;
                    break;
                }
            }
        }
        out.removeRows(keep);
        const std::string scope = options.requiredColumns.empty() ? "*" : CommonUtils::joinList(options.requiredColumns);
        result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, scope, dropped, strategy,
                                            "dropped rows missing a required field"));
        return result;
    }

    if (options.strategy == MissingStrategy::FILL_DEFAULT) {
        for (const auto& [name, value] : options.fillDefaults) {
            validateFillDefault(table.column(requireColumn(table, name)), value, table.hasRowMeta());
        }
        for (const auto& [name, value] : options.fillDefaults) {
            auto& col = out.column(requireColumn(out, name));
            const size_t filled = fillMissing(col, CommonUtils::trim(value));
            result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, name, filled, strategy, "filled with " + value));
        }
        if (result.actions.empty()) {
            result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, "", 0, strategy, "no fill defaults configured"));
        }
        return result;
    }

    for (auto& col : out.columns()) {
        const size_t missingCount = static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), static_cast<uint8_t>(1)));
        if (missingCount == 0) continue;
        const double pct = 100.0 * static_cast<double>(missingCount) / static_cast<double>(out.rowCount());

        if (col.type == ColumnType::NUMERIC) {
            const auto& values = std::get<std::vector<double>>(col.values);
            std::vector<double> present;
            for (size_t r = 0; r < values.size(); ++r) if (!col.missing[r]) present.push_back(values[r]);
            if (present.empty()) {
                result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, col.name, 0, strategy + ":median",
                                                    "no values to take a median from"));
                continue;
            }
            const double median = CommonUtils::medianByNth(present);
            const size_t filled = fillNumeric(col, median);
            result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, col.name, filled, strategy + ":median",
                                                "filled with " + RawGrid::cellText(RawCell(median))));
        } else if (col.type == ColumnType::BOOLEAN) {
            const auto& values = std::get<std::vector<uint8_t>>(col.values);
            size_t trues = 0;
            size_t present = 0;
            for (size_t r = 0; r < values.size(); ++r) {
                if (col.missing[r]) continue;
                ++present;
                trues += values[r] ? 1 : 0;
            }
            if (present == 0) continue;
            const std::string mode = trues * 2 > present ? "true" : "false";
            const size_t filled = fillMissing(col, mode);
            result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, col.name, filled, strategy + ":mode",
                                                "filled with " + mode));
        } else {
            const auto& values = std::get<std::vector<std::string>>(col.values);
            const bool useMode = pct < kUnknownThresholdPct;
            const std::string fill = useMode ? modeOf(values, col.missing) : std::string(kUnknownLabel);
            const size_t filled = fillMissing(col, fill);
            result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, col.name, filled,
                                                strategy + (useMode ? ":mode" : ":unknown"), "filled with " + fill));
        }
    }
    if (result.actions.empty()) {
        result.actions.push_back(makeAction(ActionKind::HANDLE_MISSING, "", 0, strategy, "no missing values"));
    }
    return result;
}

StageResult QualityCleaner::removeDuplicates(const TypedTable& table, const DuplicateOptions& options) {
    if (auto skipped = skipIfHandled(table, CleaningStage::DEDUPLICATED, ActionKind::REMOVE_DUPLICATES)) return *skipped;
    std::vector<size_t> keys;
    for (const auto& name : options.keyColumns) keys.push_back(requireColumn(table, name));
    if (options.keyColumns.empty()) {
        for (size_t c = 0; c < table.colCount(); ++c) keys.push_back(c);
    }

    StageResult result{table, {}};
    result.table.setStage(CleaningStage::DEDUPLICATED);
    const size_t rows = table.rowCount();
    MissingMask keep(rows, static_cast<uint8_t>(0));
    std::unordered_map<std::string, size_t> chosen;
    for (size_t r = 0; r < rows; ++r) {
        const std::string key = table.rowKey(r, keys);
        auto it = chosen.find(key);
        if (it == chosen.end()) {
            chosen.emplace(key, r);
        } else if (options.keep == KeepPolicy::LAST) {
            it->second = r;
        }
    }
    for (const auto& [key, row] : chosen) keep[row] = 1;

    std::vector<std::string> removedIds;
    size_t removed = 0;
    for (size_t r = 0; r < rows; ++r) {
        if (keep[r]) continue;
        ++removed;
        if (removedIds.size() < kLoggedIdentifierLimit) {
            removedIds.push_back(options.keyColumns.empty() ? "row " + std::to_string(r) : table.cellText(r, keys.front()));
        }
    }

    std::string detail = removed == 0 ? "no duplicates" : "removed: " + CommonUtils::joinList(removedIds);
    if (removed > removedIds.size()) detail += ", ...";
    result.table.removeRows(keep);
    result.actions.push_back(makeAction(ActionKind::REMOVE_DUPLICATES,
                                        options.keyColumns.empty() ? "*" : CommonUtils::joinList(options.keyColumns),
                                        removed, std::string("keep_") + keepPolicyName(options.keep), detail));
    return result;
}

StageResult QualityCleaner::handleOutliers(const TypedTable& table, const OutlierOptions& options) {
    if (auto skipped = skipIfHandled(table, CleaningStage::OUTLIERS_HANDLED, ActionKind::HANDLE_OUTLIERS)) return *skipped;
    requirePositiveMultiplier(options.multiplier);
    std::vector<std::string> columns = options.columns;
    if (columns.empty()) {
        for (size_t idx : table.numericColumnIndices()) columns.push_back(table.column(idx).name);
    }
    for (const auto& name : columns) {
        if (table.column(requireColumn(table, name)).type != ColumnType::NUMERIC) {
            throw Survex::ConfigurationException("Outlier column is not numeric: " + name);
        }
    }

    StageResult result{table, {}};
    TypedTable& out = result.table;
    out.setStage(CleaningStage::OUTLIERS_HANDLED);
    const std::string strategy = outlierMethodName(options.method);

    for (const auto& name : columns) {
        const auto report = QualityAnalyzer::outlierReport(out, name, options.multiplier);
        const std::string fence = "bounds [" + CommonUtils::formatNumber(report.bounds.lower) + ", " +
                                  CommonUtils::formatNumber(report.bounds.upper) + "]";

        if (options.method == OutlierMethod::CAP) {
            auto& col = out.column(requireColumn(out, name));
            auto& values = std::get<std::vector<double>>(col.values);
            for (size_t r : report.rows) {
                values[r] = std::min(std::max(values[r], report.bounds.lower), report.bounds.upper);
            }
            result.actions.push_back(makeAction(ActionKind::HANDLE_OUTLIERS, name, report.rows.size(), strategy, "capped to " + fence));
        } else if (options.method == OutlierMethod::REMOVE) {
            MissingMask keep(out.rowCount(), static_cast<uint8_t>(1));
            for (size_t r : report.rows) keep[r] = 0;
            out.removeRows(keep);
            result.actions.push_back(makeAction(ActionKind::HANDLE_OUTLIERS, name, report.rows.size(), strategy, "removed outside " + fence));
        } else {
            const std::string flagName = name + kOutlierFlagSuffix;
            std::vector<uint8_t> flags(out.rowCount(), static_cast<uint8_t>(0));
            for (size_t r : report.rows) flags[r] = 1;
            const int existing = out.findColumnIndex(flagName);
            if (existing >= 0) {
                auto& col = out.column(static_cast<size_t>(existing));
                col.type = ColumnType::BOOLEAN;
                col.values = std::move(flags);
                col.missing.assign(out.rowCount(), static_cast<uint8_t>(0));
                col.flags.clear();
            } else {
                TypedColumn col;
                col.name = flagName;
                col.type = ColumnType::BOOLEAN;
                col.values = std::move(flags);
                col.missing.assign(out.rowCount(), static_cast<uint8_t>(0));
                out.addColumn(std::move(col));
            }
            result.actions.push_back(makeAction(ActionKind::HANDLE_OUTLIERS, name, report.rows.size(), strategy,
                                                "flagged in " + flagName + " outside " + fence));
        }
    }
    if (result.actions.empty()) {
        result.actions.push_back(makeAction(ActionKind::HANDLE_OUTLIERS, "", 0, strategy, "no numeric columns"));
    }
    return result;
}

CleaningPipeline::CleaningPipeline(TypedTable raw) : table_(std::move(raw)) {}

void CleaningPipeline::commit(StageResult result) {
    table_ = std::move(result.table);
    log_.insert(log_.end(), std::make_move_iterator(result.actions.begin()), std::make_move_iterator(result.actions.end()));
}

void CleaningPipeline::handleMissing(const MissingOptions& options) {
    commit(QualityCleaner::handleMissing(table_, options));
}

void CleaningPipeline::removeDuplicates(const DuplicateOptions& options) {
    commit(QualityCleaner::removeDuplicates(table_, options));
}

void CleaningPipeline::handleOutliers(const OutlierOptions& options) {
    commit(QualityCleaner::handleOutliers(table_, options));
}

const char* missingStrategyName(MissingStrategy strategy) {
    switch (strategy) {
        case MissingStrategy::SMART: return "smart";
        case MissingStrategy::DROP: return "drop";
        case MissingStrategy::FILL_DEFAULT: return "fill_default";
    }
    return "unknown";
}

const char* keepPolicyName(KeepPolicy keep) {
    return keep == KeepPolicy::FIRST ? "first" : "last";
}

const char* outlierMethodName(OutlierMethod method) {
    switch (method) {
        case OutlierMethod::CAP: return "cap";
        case OutlierMethod::REMOVE: return "remove";
        case OutlierMethod::FLAG: return "flag";
    }
    return "unknown";
}

const char* cleaningStageName(CleaningStage stage) {
    switch (stage) {
        case CleaningStage::RAW: return "raw";
        case CleaningStage::MISSING_HANDLED: return "missing_handled";
        case CleaningStage::DEDUPLICATED: return "deduplicated";
        case CleaningStage::OUTLIERS_HANDLED: return "outliers_handled";
        case CleaningStage::CLEAN: return "clean";
    }
    return "unknown";
}

const char* actionKindName(ActionKind kind) {
    switch (kind) {
        case ActionKind::HANDLE_MISSING: return "handle_missing";
        case ActionKind::REMOVE_DUPLICATES: return "remove_duplicates";
        case ActionKind::HANDLE_OUTLIERS: return "handle_outliers";
    }
    return "unknown";
}
