#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace CommonUtils {

inline std::string trim(std::string_view s) {
    const size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(b, e - b + 1));
}

// ASCII-only case folding; UTF-8 continuation bytes pass through untouched.
inline std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return out;
}

inline std::string toUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::toupper(c)) : static_cast<char>(c);
    });
    return out;
}

inline bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

inline size_t countWords(std::string_view s) {
    std::istringstream is{std::string(s)};
    size_t n = 0;
    std::string word;
    while (is >> word) ++n;
    return n;
}

inline std::vector<std::string> splitList(const std::string& s, char separator = ',') {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == separator) {
            std::string t = trim(cur);
            if (!t.empty()) out.push_back(t);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    std::string t = trim(cur);
    if (!t.empty()) out.push_back(t);
    return out;
}

inline std::string joinList(const std::vector<std::string>& items, const std::string& separator = ", ") {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += separator;
        out += items[i];
    }
    return out;
}

inline double medianByNth(std::vector<double> values) {
    if (values.empty()) return 0.0;
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + mid, values.end());
    const double upper = values[mid];
    if (values.size() % 2 == 0) {
        const double lower = *std::max_element(values.begin(), values.begin() + mid);
        return (lower + upper) / 2.0;
    }
    return upper;
}

// Linear interpolation between closest ranks, the same estimator the
// exported quality reports were calibrated against.
inline double quantileByNth(std::vector<double> values, double q) {
    if (values.empty()) return 0.0;
    if (q <= 0.0) return *std::min_element(values.begin(), values.end());
    if (q >= 1.0) return *std::max_element(values.begin(), values.end());

    const double pos = q * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = static_cast<size_t>(std::ceil(pos));

    std::nth_element(values.begin(), values.begin() + lo, values.end());
    const double loVal = values[lo];
    if (hi == lo) return loVal;

    const double hiVal = *std::min_element(values.begin() + lo + 1, values.end());
    const double frac = pos - static_cast<double>(lo);
    return loVal + (hiVal - loVal) * frac;
}

inline std::string formatNumber(double v, int precision = 2) {
    if (!std::isfinite(v)) return "n/a";
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(precision);
    os << v;
    return os.str();
}

} // namespace CommonUtils
