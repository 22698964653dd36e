#pragma once

#include "NormalizedTable.h"

#include <optional>
#include <string>
#include <vector>

struct ClassifierRules {
    // Matched case-insensitively as substrings of the label.
    std::vector<std::string> sectionKeywords = {
        "consumption", "expenditure", "food", "housing", "dwelling",
        "furniture", "household equipment", "clothing", "footwear",
        "health", "education", "culture", "entertainment",
        "transport", "communications", "miscellaneous"};
    std::vector<std::string> sectionQualifiers = {"excl.", "total"};
    size_t sectionMaxWords = 3;
    size_t detailMinWords = 7;

    // Whole-label aggregate keywords, compared case-insensitively.
    std::vector<std::string> garbageKeywords = {
        "CONSUMPTION", "EXPENDITURE", "TOTAL", "TOTAL CONSUMPTION", "SUM", "\xD7\xA1\xD7\x9A \xD7\x94\xD7\x9B\xD7\x9C"};
    std::vector<std::string> tableIdTokens = {"1.1", "3.8", "4.0"};

    // Index into the row's cells; an empty total marks a structural spacer row.
    std::optional<size_t> totalColumn;
};

struct Classification {
    RowLevel level = RowLevel::SUBCATEGORY;
    RowAction action = RowAction::KEEP;
    DropReason reason = DropReason::NONE;

    bool operator==(const Classification& other) const noexcept {
        return level == other.level && action == other.action && reason == other.reason;
    }
};

class RowClassifier {
public:
    /**
     * @brief Decides whether a row is kept and at which hierarchy level.
     * @details First match wins: error margin, table title/aggregate keyword,
     * numbered footnote, blank label, then section/detail/subcategory. A kept row
     * whose total cell is empty is dropped with MISSING_TOTAL.
     * Consults only the row's own label and cells.
     */
    static Classification classifyRow(const std::string& label,
                                      const std::vector<NormalizedCell>& cells,
                                      const ClassifierRules& rules);

    static RowLevel hierarchyLevel(const std::string& label, const ClassifierRules& rules);
    static bool isGarbageLabel(const std::string& label, const ClassifierRules& rules);
    static bool isNumberedFootnote(const std::string& label);
};
