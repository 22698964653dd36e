#include "CellNormalizer.h"
#include "CommonUtils.h"

#include <charconv>
#include <cmath>
#include <optional>
#include <string>

namespace {
constexpr std::string_view kPlusMinus = "\xC2\xB1";

std::optional<double> parsePlainNumber(std::string_view token) {
    std::string cleaned;
    cleaned.reserve(token.size());
    for (char c : token) {
        if (c == ',') continue;
        cleaned.push_back(c);
    }
    cleaned = CommonUtils::trim(cleaned);
    if (!cleaned.empty() && cleaned.front() == '+') cleaned.erase(cleaned.begin());
    if (!cleaned.empty() && cleaned.back() == '%') cleaned.pop_back();
    if (cleaned.empty()) return std::nullopt;

    double out = 0.0;
    const char* b = cleaned.data();
    const char* e = b + cleaned.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    if (ec != std::errc{} || p != e || !std::isfinite(out)) return std::nullopt;
    return out;
}

NormalizedCell fromNumber(double v, CellFlags flags) {
    NormalizedCell cell;
    cell.flags = flags;
    if (!std::isfinite(v)) return cell;
    cell.value = std::abs(v);
    return cell;
}
} // namespace

namespace CellNormalizer {

bool hasErrorMarginMarker(std::string_view text) {
    return CommonUtils::contains(text, kPlusMinus);
}

bool isSuppressedToken(std::string_view text) {
    const std::string t = CommonUtils::trim(text);
    return t == ".." || t == "-";
}

NormalizedCell normalizeText(std::string_view text) {
    NormalizedCell cell;
    const std::string t = CommonUtils::trim(text);
    if (t.empty() || CommonUtils::toLower(t) == "nan") return cell;

    if (isSuppressedToken(t)) {
        cell.flags.suppressed = true;
        return cell;
    }
    if (hasErrorMarginMarker(t)) {
        cell.flags.errorMargin = true;
        return cell;
    }

    if (t.size() >= 3 && t.front() == '(' && t.back() == ')') {
        const auto inner = parsePlainNumber(std::string_view(t).substr(1, t.size() - 2));
        if (!inner) return cell;
        CellFlags flags;
        flags.lowReliability = true;
        return fromNumber(*inner, flags);
    }

    const auto parsed = parsePlainNumber(t);
    if (!parsed) return cell;
    return fromNumber(*parsed, CellFlags{});
}

NormalizedCell normalizeCell(const RawCell& raw) {
    if (const auto* d = std::get_if<double>(&raw)) return fromNumber(*d, CellFlags{});
    if (const auto* s = std::get_if<std::string>(&raw)) return normalizeText(*s);
    return NormalizedCell{};
}

} // namespace CellNormalizer
