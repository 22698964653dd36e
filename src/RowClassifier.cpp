#include "RowClassifier.h"
#include "CellNormalizer.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {
Classification dropped(RowLevel level, DropReason reason) {
    return Classification{level, RowAction::DROP, reason};
}
} // namespace

bool RowClassifier::isGarbageLabel(const std::string& label, const ClassifierRules& rules) {
    static const std::regex kTableNumber(R"(TABLE\s+\d+(\.\d+)?)");

    const std::string upper = CommonUtils::toUpper(CommonUtils::trim(label));
    if (CommonUtils::contains(upper, "TABLE")) {
        for (const auto& token : rules.tableIdTokens) {
            if (CommonUtils::contains(upper, token)) return true;
        }
        if (std::regex_search(upper, kTableNumber)) return true;
    }
    return std::any_of(rules.garbageKeywords.begin(), rules.garbageKeywords.end(), [&](const std::string& kw) {
        return upper == CommonUtils::toUpper(kw);
    });
}

bool RowClassifier::isNumberedFootnote(const std::string& label) {
    return label.size() > 2 && label[0] == '(' && std::isdigit(static_cast<unsigned char>(label[1]));
}

RowLevel RowClassifier::hierarchyLevel(const std::string& label, const ClassifierRules& rules) {
    const std::string lower = CommonUtils::toLower(label);
    const size_t words = CommonUtils::countWords(label);

    const bool hasSectionKeyword = std::any_of(rules.sectionKeywords.begin(), rules.sectionKeywords.end(),
                                               [&](const std::string& kw) { return CommonUtils::contains(lower, CommonUtils::toLower(kw)); });
    if (hasSectionKeyword) {
        const bool qualified = std::any_of(rules.sectionQualifiers.begin(), rules.sectionQualifiers.end(),
                                           [&](const std::string& q) { return CommonUtils::contains(lower, CommonUtils::toLower(q)); });
        if (qualified || words <= rules.sectionMaxWords) return RowLevel::SECTION;
    }

    if (CommonUtils::contains(label, ",") || words >= rules.detailMinWords) return RowLevel::DETAIL;
    return RowLevel::SUBCATEGORY;
}

Classification RowClassifier::classifyRow(const std::string& rawLabel,
                                          const std::vector<NormalizedCell>& cells,
                                          const ClassifierRules& rules) {
    const std::string label = CommonUtils::trim(rawLabel);

    const bool errorMarginCell = std::any_of(cells.begin(), cells.end(), [](const NormalizedCell& c) {
        return c.flags.errorMargin;
    });
    if (CellNormalizer::hasErrorMarginMarker(label) || errorMarginCell) {
        return dropped(RowLevel::ERROR_MARGIN, DropReason::ERROR_MARGIN);
    }
    if (!label.empty() && isGarbageLabel(label, rules)) return dropped(RowLevel::GARBAGE, DropReason::GARBAGE);
    if (isNumberedFootnote(label)) return dropped(RowLevel::FOOTNOTE, DropReason::FOOTNOTE);
    if (label.empty() || CommonUtils::toLower(label) == "nan") return dropped(RowLevel::BLANK, DropReason::BLANK);

    const RowLevel level = hierarchyLevel(label, rules);
    if (rules.totalColumn) {
        const size_t idx = *rules.totalColumn;
        if (idx >= cells.size() || !cells[idx].value) return dropped(level, DropReason::MISSING_TOTAL);
    }
    return Classification{level, RowAction::KEEP, DropReason::NONE};
}
