#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using RawCell = std::variant<std::monostate, double, std::string>;

/**
 * @brief Rectangular view over a spreadsheet export: optional string/number cells by (row, col).
 * @details Ragged input rows are padded, so every row reports colCount() cells.
 */
class RawGrid {
public:
    RawGrid() = default;
    explicit RawGrid(std::vector<std::vector<RawCell>> rows);

    size_t rowCount() const noexcept { return rows_.size(); }
    size_t colCount() const noexcept { return colCount_; }

    /**
     * @brief Returns the cell at (row, col), or an empty cell outside the grid.
     */
    const RawCell& at(size_t row, size_t col) const noexcept;

    /**
     * @brief Text form of a cell: empty for blanks, integral numbers without a fraction ("5.0" -> "5").
     */
    static std::string cellText(const RawCell& cell);
    static bool isEmptyCell(const RawCell& cell);

private:
    std::vector<std::vector<RawCell>> rows_;
    size_t colCount_ = 0;
};
