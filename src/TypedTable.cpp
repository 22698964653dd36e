#include "TypedTable.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "RawGrid.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace {
bool isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(s);
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

bool parseDouble(const std::string& raw, double& out) {
    const std::string s = CommonUtils::trim(raw);
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    if (*b == '+') ++b;
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e && std::isfinite(out);
}

bool parseBool(const std::string& raw, uint8_t& out) {
    const std::string s = CommonUtils::toLower(CommonUtils::trim(raw));
    if (s == "true") {
        out = 1;
        return true;
    }
    if (s == "false") {
        out = 0;
        return true;
    }
    return false;
}
} // namespace

TypedTable TypedTable::fromCSV(const std::string& filename, char delimiter) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Survex::IOException("Could not open file: " + filename);

    CSVUtils::skipBOM(in);
    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter, &malformed);
    if (malformed || header.empty()) throw Survex::IOException("Malformed or empty CSV header in " + filename);
    header = CSVUtils::normalizeHeader(header);

    std::vector<std::vector<std::string>> records;
    while (in.peek() != EOF) {
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed);
        if (malformed) {
            throw Survex::IOException("Unterminated quoted field in " + filename + " at record " +
                                      std::to_string(records.size() + 1));
        }
        if (row.empty()) continue;
        row.resize(header.size());
        records.push_back(std::move(row));
    }

    TypedTable table;
    table.rowCount_ = records.size();
    for (size_t c = 0; c < header.size(); ++c) {
        size_t nonMissing = 0;
        size_t numericHits = 0;
        size_t boolHits = 0;
        for (const auto& row : records) {
            if (isMissingToken(row[c])) continue;
            ++nonMissing;
            double dv = 0.0;
            uint8_t bv = 0;
            if (parseDouble(row[c], dv)) ++numericHits;
            else if (parseBool(row[c], bv)) ++boolHits;
        }

        TypedColumn col;
        col.name = header[c];
        col.missing.assign(records.size(), static_cast<uint8_t>(0));
        if (nonMissing > 0 && numericHits == nonMissing) {
            col.type = ColumnType::NUMERIC;
            std::vector<double> values(records.size(), 0.0);
            for (size_t r = 0; r < records.size(); ++r) {
                if (isMissingToken(records[r][c]) || !parseDouble(records[r][c], values[r])) col.missing[r] = 1;
            }
            col.values = std::move(values);
        } else if (nonMissing > 0 && boolHits == nonMissing) {
            col.type = ColumnType::BOOLEAN;
            std::vector<uint8_t> values(records.size(), static_cast<uint8_t>(0));
            for (size_t r = 0; r < records.size(); ++r) {
                if (isMissingToken(records[r][c]) || !parseBool(records[r][c], values[r])) col.missing[r] = 1;
            }
            col.values = std::move(values);
        } else {
            col.type = ColumnType::CATEGORICAL;
            std::vector<std::string> values(records.size());
            for (size_t r = 0; r < records.size(); ++r) {
                if (isMissingToken(records[r][c])) {
                    col.missing[r] = 1;
                } else {
                    values[r] = CommonUtils::trim(records[r][c]);
                }
            }
            col.values = std::move(values);
        }
        table.columns_.push_back(std::move(col));
    }
    return table;
}

TypedTable TypedTable::fromNormalized(const NormalizedTable& source) {
    TypedTable table;
    const auto& rows = source.rows();
    table.rowCount_ = rows.size();
    table.labelColumn_ = source.labelColumn();
    table.valueSpecs_ = source.columns();
    table.leveled_ = true;

    TypedColumn label;
    label.name = source.labelColumn();
    label.type = ColumnType::CATEGORICAL;
    std::vector<std::string> labels;
    labels.reserve(rows.size());
    label.missing.assign(rows.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < rows.size(); ++r) {
        labels.push_back(rows[r].label);
        if (rows[r].label.empty()) label.missing[r] = 1;
    }
    label.values = std::move(labels);
    table.columns_.push_back(std::move(label));

    for (size_t c = 0; c < source.colCount(); ++c) {
        TypedColumn col;
        col.name = source.columns()[c].name;
        col.type = ColumnType::NUMERIC;
        std::vector<double> values(rows.size(), 0.0);
        col.missing.assign(rows.size(), static_cast<uint8_t>(0));
        col.flags.resize(rows.size());
        for (size_t r = 0; r < rows.size(); ++r) {
            const auto& cell = rows[r].cells[c];
            if (cell.value) {
                values[r] = *cell.value;
            } else {
                col.missing[r] = 1;
            }
            col.flags[r] = cell.flags;
        }
        col.values = std::move(values);
        table.columns_.push_back(std::move(col));
    }

    table.rowMeta_.reserve(rows.size());
    for (const auto& row : rows) table.rowMeta_.push_back(RowMeta{row.sourceRow, row.level, row.flags});
    return table;
}

NormalizedTable TypedTable::toNormalizedTable() const {
    if (!leveled_) throw Survex::TableException("Table carries no row level metadata");

    const int labelIdx = findColumnIndex(labelColumn_);
    std::vector<int> valueIdx;
    for (const auto& spec : valueSpecs_) {
        const int idx = findColumnIndex(spec.name);
        if (idx < 0 || columns_[static_cast<size_t>(idx)].type != ColumnType::NUMERIC) {
            throw Survex::TableException("Value column is missing or not numeric: " + spec.name);
        }
        valueIdx.push_back(idx);
    }

    std::vector<NormalizedRow> rows(rowCount_);
    for (size_t r = 0; r < rowCount_; ++r) {
        auto& out = rows[r];
        out.sourceRow = rowMeta_[r].sourceRow;
        out.level = rowMeta_[r].level;
        if (labelIdx >= 0) out.label = cellText(r, static_cast<size_t>(labelIdx));
        for (int idx : valueIdx) {
            const auto& col = columns_[static_cast<size_t>(idx)];
            NormalizedCell cell;
            if (!col.missing[r]) cell.value = std::get<std::vector<double>>(col.values)[r];
            if (!col.flags.empty()) cell.flags = col.flags[r];
            out.flags.merge(cell.flags);
            out.cells.push_back(cell);
        }
    }
    return NormalizedTable(labelColumn_, valueSpecs_, std::move(rows));
}

void TypedTable::addColumn(TypedColumn column) {
    if (columns_.empty() && !leveled_) rowCount_ = column.missing.size();
    if (column.missing.size() != rowCount_) {
        throw Survex::TableException("Column '" + column.name + "' has " + std::to_string(column.missing.size()) +
                                     " rows, expected " + std::to_string(rowCount_));
    }
    if (findColumnIndex(column.name) >= 0) throw Survex::TableException("Duplicate column name: " + column.name);
    columns_.push_back(std::move(column));
}

std::vector<size_t> TypedTable::numericColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::NUMERIC) out.push_back(i);
    return out;
}

std::vector<size_t> TypedTable::categoricalColumnIndices() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].type == ColumnType::CATEGORICAL) out.push_back(i);
    return out;
}

int TypedTable::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) if (columns_[i].name == name) return static_cast<int>(i);
    return -1;
}

std::string TypedTable::cellText(size_t row, size_t col) const {
    const auto& column = columns_.at(col);
    if (column.missing.at(row)) return "";
    switch (column.type) {
        case ColumnType::NUMERIC:
            return RawGrid::cellText(RawCell(std::get<std::vector<double>>(column.values)[row]));
        case ColumnType::BOOLEAN:
            return std::get<std::vector<uint8_t>>(column.values)[row] ? "true" : "false";
        case ColumnType::CATEGORICAL:
            return std::get<std::vector<std::string>>(column.values)[row];
    }
    return "";
}

std::vector<size_t> TypedTable::rowsByLevel(RowLevel level) const {
    std::vector<size_t> out;
    for (size_t r = 0; r < rowMeta_.size(); ++r) {
        if (rowMeta_[r].level == level) out.push_back(r);
    }
    return out;
}

namespace {
template <typename T>
void filterVector(std::vector<T>& values, const MissingMask& keepMask) {
    if (values.empty()) return;
    std::vector<T> next;
    next.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        if (keepMask[i]) next.push_back(std::move(values[i]));
    }
    values = std::move(next);
}
} // namespace

void TypedTable::removeRows(const MissingMask& keepMask) {
    if (keepMask.size() != rowCount_) throw Survex::TableException("Row mask size mismatch");

    for (auto& col : columns_) {
        std::visit([&](auto& values) { filterVector(values, keepMask); }, col.values);
        filterVector(col.missing, keepMask);
        filterVector(col.flags, keepMask);
    }
    filterVector(rowMeta_, keepMask);

    rowCount_ = static_cast<size_t>(std::count_if(keepMask.begin(), keepMask.end(), [](uint8_t k) { return k != 0; }));
}

std::string TypedTable::rowKey(size_t row, const std::vector<size_t>& columns) const {
    std::ostringstream key;
    key.precision(std::numeric_limits<double>::max_digits10);
    for (size_t c : columns) {
        const auto& col = columns_.at(c);
        if (col.missing.at(row)) {
            key << '\x1e';
        } else if (col.type == ColumnType::NUMERIC) {
            key << std::get<std::vector<double>>(col.values)[row];
        } else {
            key << cellText(row, c);
        }
        key << '\x1f';
    }
    return key.str();
}

const char* columnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::BOOLEAN: return "boolean";
    }
    return "unknown";
}
