#pragma once

#include "NormalizedTable.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, BOOLEAN };
// Furthest cleaning stage applied to a table value; copied along with the table.
enum class CleaningStage { RAW, MISSING_HANDLED, DEDUPLICATED, OUTLIERS_HANDLED, CLEAN };
using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<uint8_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;
    std::vector<CellFlags> flags; // empty, or one entry per row
};

struct RowMeta {
    size_t sourceRow = 0;
    RowLevel level = RowLevel::SUBCATEGORY;
    CellFlags flags;
};

/**
 * @brief Column-typed table the quality stages read and produce.
 * @details A value type: cleaning stages copy, filter and return a new TypedTable.
 * Tables built from a NormalizedTable carry per-row level metadata, kept aligned by removeRows().
 */
class TypedTable {
public:
    TypedTable() = default;

    /**
     * @brief Loads a flat CSV and infers per-column types.
     * @details A column is NUMERIC when every non-missing value parses as a number,
     * BOOLEAN when every non-missing value is true/false, else CATEGORICAL.
     * @throws Survex::IOException when the file cannot be read or a record is malformed.
     */
    static TypedTable fromCSV(const std::string& filename, char delimiter = ',');

    /**
     * @brief Label becomes a categorical column, value columns numeric, row level and flags kept as metadata.
     */
    static TypedTable fromNormalized(const NormalizedTable& table);

    /**
     * @brief Rebuilds a leveled table from the label column and the original value columns.
     * @throws Survex::TableException when the table carries no row metadata or a value column is gone.
     */
    NormalizedTable toNormalizedTable() const;

    /**
     * @brief Appends a column; the first column of an empty table sets rowCount().
     * @throws Survex::TableException when the column length disagrees with rowCount() or the name is taken.
     */
    void addColumn(TypedColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    std::vector<TypedColumn>& columns() noexcept { return columns_; }
    const TypedColumn& column(size_t idx) const { return columns_.at(idx); }
    TypedColumn& column(size_t idx) { return columns_.at(idx); }

    std::vector<size_t> numericColumnIndices() const;
    std::vector<size_t> categoricalColumnIndices() const;

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    bool isMissing(size_t row, size_t col) const { return columns_.at(col).missing.at(row) != 0; }

    /**
     * @brief Text form of a cell; empty when missing.
     */
    std::string cellText(size_t row, size_t col) const;

    /**
     * @brief Equality key over the given columns. Numbers keep every significant digit;
     * missing cells share one marker.
     */
    std::string rowKey(size_t row, const std::vector<size_t>& columns) const;

    CleaningStage stage() const noexcept { return stage_; }
    void setStage(CleaningStage stage) noexcept { stage_ = stage; }

    bool hasRowMeta() const noexcept { return leveled_; }
    const std::vector<RowMeta>& rowMeta() const noexcept { return rowMeta_; }
    const std::string& labelColumn() const noexcept { return labelColumn_; }

    /**
     * @brief Indices of rows at one hierarchy level; empty for tables without metadata.
     */
    std::vector<size_t> rowsByLevel(RowLevel level) const;

    /**
     * @brief Removes rows where keepMask is false across all columns and row metadata.
     * @pre keepMask.size() == rowCount().
     * @throws Survex::TableException when mask size mismatches row count.
     */
    void removeRows(const MissingMask& keepMask);

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
    std::vector<RowMeta> rowMeta_;
    std::vector<ColumnSpec> valueSpecs_;
    std::string labelColumn_;
    bool leveled_ = false;
    CleaningStage stage_ = CleaningStage::RAW;
};

const char* columnTypeName(ColumnType type);
