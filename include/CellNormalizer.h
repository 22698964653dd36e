#pragma once

#include "NormalizedTable.h"
#include "RawGrid.h"

#include <string_view>

namespace CellNormalizer {

/**
 * @brief Parses one raw cell into a non-negative value plus quality flags.
 * @details Rule order: blank/NaN -> empty; ".." or "-" -> empty + suppressed;
 * "±" -> empty + error margin; "(12.3)" -> 12.3 + low reliability;
 * thousands separators stripped; unparsable text -> empty without flags.
 * Negative results are stored as their absolute value.
 * @post value, when present, is finite and >= 0. Never throws.
 */
NormalizedCell normalizeCell(const RawCell& raw);
NormalizedCell normalizeText(std::string_view text);

bool hasErrorMarginMarker(std::string_view text);
bool isSuppressedToken(std::string_view text);

} // namespace CellNormalizer
