#include "TableAssembler.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <utility>

std::optional<double> TableAssembler::checksumDeviation(const NormalizedRow& row, const std::vector<ColumnSpec>& columns) {
    std::optional<double> total;
    double sum = 0.0;
    for (size_t c = 0; c < columns.size() && c < row.cells.size(); ++c) {
        const auto& v = row.cells[c].value;
        if (columns[c].role == ColumnRole::TOTAL) {
            total = v;
        } else if (v) {
            sum += *v;
        }
    }
    if (!total) return std::nullopt;
    return std::abs(sum - *total);
}

AssemblyResult TableAssembler::assemble(std::vector<ClassifiedRow> rows,
                                        const std::vector<ColumnSpec>& columns,
                                        const AssemblyOptions& options) {
    std::stable_sort(rows.begin(), rows.end(), [](const ClassifiedRow& a, const ClassifiedRow& b) {
        return a.sourceRow < b.sourceRow;
    });

    AssemblyResult result;
    std::vector<NormalizedRow> kept;
    kept.reserve(rows.size());
    for (auto& row : rows) {
        if (row.action == RowAction::DROP) {
            result.dropCounts[row.reason]++;
            continue;
        }
        const bool allEmpty = std::none_of(row.cells.begin(), row.cells.end(), [](const NormalizedCell& c) {
            return c.value.has_value();
        });
        if (allEmpty) {
            result.dropCounts[DropReason::ALL_EMPTY]++;
            continue;
        }

        NormalizedRow out;
        out.sourceRow = row.sourceRow;
        out.label = std::move(row.label);
        out.level = row.level;
        out.cells = std::move(row.cells);
        for (const auto& cell : out.cells) out.flags.merge(cell.flags);
        kept.push_back(std::move(out));
    }

    if (options.percentOfTotal) {
        std::string totalName;
        for (const auto& col : columns) {
            if (col.role == ColumnRole::TOTAL) totalName = col.name;
        }
        for (size_t r = 0; r < kept.size(); ++r) {
            const auto deviation = checksumDeviation(kept[r], columns);
            if (!deviation || *deviation <= options.checksumTolerance) continue;
            QualityIssue issue;
            issue.kind = IssueKind::CHECKSUM_MISMATCH;
            issue.column = totalName;
            issue.row = r;
            issue.severity = IssueSeverity::WARNING;
            issue.detail = "'" + kept[r].label + "' (source row " + std::to_string(kept[r].sourceRow) +
                           ") categories deviate from total by " + CommonUtils::formatNumber(*deviation);
            result.issues.push_back(std::move(issue));
        }
    }

    result.table = NormalizedTable(options.labelColumn, columns, std::move(kept));
    return result;
}
