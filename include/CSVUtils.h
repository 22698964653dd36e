#pragma once

#include "RawGrid.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// CSV tokenization for spreadsheet exports and flat tables. Cells are read
// verbatim; CellNormalizer and TypedTable own the interpretation.

void skipBOM(std::istream& is);

/**
 * @brief Reads one CSV record (quoted fields may span lines).
 * @post *malformed is true when the record ends inside an open quote.
 */
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

/**
 * @brief Spreadsheet-export cell: empty -> monostate, plain number -> double, anything else -> string.
 * @details "1,234", "(5.2)" and ".." stay strings so CellNormalizer sees the source notation.
 */
RawCell parseGridCell(const std::string& field);

/**
 * @brief Loads every record of a sheet export into a RawGrid, blank lines included,
 * so grid row indices match source line order.
 * @throws Survex::IOException on an unterminated quoted field.
 */
RawGrid readGrid(std::istream& is, char delimiter);
RawGrid readGridFile(const std::string& path, char delimiter);

std::string escapeField(const std::string& value, char delimiter);
void writeRecord(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
