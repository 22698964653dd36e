#include "RawGrid.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {
const RawCell kEmptyCell{};
}

RawGrid::RawGrid(std::vector<std::vector<RawCell>> rows) : rows_(std::move(rows)) {
    for (const auto& r : rows_) colCount_ = std::max(colCount_, r.size());
    for (auto& r : rows_) r.resize(colCount_);
}

const RawCell& RawGrid::at(size_t row, size_t col) const noexcept {
    if (row >= rows_.size() || col >= colCount_) return kEmptyCell;
    return rows_[row][col];
}

std::string RawGrid::cellText(const RawCell& cell) {
    if (const auto* s = std::get_if<std::string>(&cell)) return CommonUtils::trim(*s);
    if (const auto* d = std::get_if<double>(&cell)) {
        if (!std::isfinite(*d)) return "";
        if (std::floor(*d) == *d && std::abs(*d) < 1e15) {
            return std::to_string(static_cast<long long>(*d));
        }
        std::ostringstream os;
        os.precision(15);
        os << *d;
        return os.str();
    }
    return "";
}

bool RawGrid::isEmptyCell(const RawCell& cell) {
    if (std::holds_alternative<std::monostate>(cell)) return true;
    if (const auto* d = std::get_if<double>(&cell)) return std::isnan(*d);
    return CommonUtils::trim(std::get<std::string>(cell)).empty();
}
