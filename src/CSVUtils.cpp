#include "CSVUtils.h"
#include "CommonUtils.h"
#include "SurvexExceptions.h"

#include <charconv>
#include <cmath>
#include <fstream>
#include <unordered_set>

namespace CSVUtils {
namespace {
std::string trimUnquoted(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;
    char buf[3] = {0, 0, 0};
    size_t matched = 0;
    while (matched < 3 && is.peek() != EOF && static_cast<unsigned char>(is.peek()) == kBom[matched]) {
        buf[matched] = static_cast<char>(is.get());
        ++matched;
    }
    if (matched == 3) return;
    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched > 0) {
        is.putback(buf[--matched]);
    }
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawData = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquoted(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (c == '"') {
            sawData = true;
            if (!inQuotes && CommonUtils::trim(val).empty()) {
                val.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
        } else if (c == delimiter && !inQuotes) {
            sawData = true;
            pushField();
        } else if ((c == '\n' || c == '\r') && !inQuotes) {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            if (c == '\r' && is.peek() == '\n') {
                is.get();
                c = '\n';
            }
            val += c;
            sawData = true;
        }
    }

    if (inQuotes && malformed) *malformed = true;
    if (sawData) pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = CommonUtils::trim(out[i]);
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);
        const std::string base = out[i];
        for (size_t suffix = 2; seen.count(out[i]) != 0; ++suffix) {
            out[i] = base + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

RawCell parseGridCell(const std::string& field) {
    const std::string t = CommonUtils::trim(field);
    if (t.empty()) return std::monostate{};

    double value = 0.0;
    const char* b = t.data();
    const char* e = b + t.size();
    if (*b == '+') ++b;
    auto [p, ec] = std::from_chars(b, e, value, std::chars_format::general);
    if (ec == std::errc{} && p == e && std::isfinite(value)) return value;
    return t;
}

RawGrid readGrid(std::istream& is, char delimiter) {
    skipBOM(is);
    std::vector<std::vector<RawCell>> rows;
    while (is.peek() != EOF) {
        bool malformed = false;
        const auto fields = parseCSVLine(is, delimiter, &malformed);
        if (malformed) {
            throw Survex::IOException("Unterminated quoted field at sheet row " + std::to_string(rows.size()));
        }
        std::vector<RawCell> cells;
        cells.reserve(fields.size());
        for (const auto& f : fields) cells.push_back(parseGridCell(f));
        rows.push_back(std::move(cells));
    }
    return RawGrid(std::move(rows));
}

RawGrid readGridFile(const std::string& path, char delimiter) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Survex::IOException("Could not open file: " + path);
    return readGrid(in, delimiter);
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos || value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos || value.find('\r') != std::string::npos;
    if (!needsQuotes) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void writeRecord(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) os << delimiter;
        os << escapeField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
