#include "AutoConfig.h"
#include "CommonUtils.h"
#include "QualityCleaner.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <utility>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        const std::string trimmed = CommonUtils::trim(value);
        T parsed = parser(trimmed, &pos);
        if (pos != trimmed.size()) {
            throw Survex::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Survex::SurvexException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Survex::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    const int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Survex::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    const double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) throw Survex::ConfigurationException("Value for " + key + " must be finite");
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Survex::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::vector<std::string> parseListStrict(const std::string& value, const std::string& key) {
    auto items = CommonUtils::splitList(value);
    for (auto& item : items) {
        if (item.size() >= 2 && item.front() == '"' && item.back() == '"') item = item.substr(1, item.size() - 2);
    }
    if (items.empty()) throw Survex::ConfigurationException("Empty list for " + key);
    return items;
}

// Drops JSON-ish braces and a trailing comma so `{"key": "value",}` reads as `key: value`.
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') out.erase(lastNonSpace, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Column names after "fill." keep their case; everything else is snake_case.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    if (lowered.rfind("fill.", 0) == 0) return "fill." + key.substr(5);
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t toSize(int v) { return static_cast<size_t>(v); }
} // namespace

void AutoConfig::set(const std::string& rawKey, const std::string& value) {
    const std::string key = normalizeConfigKey(rawKey);
    auto& ex = extraction;
    auto& q = quality;

    if (key.rfind("fill.", 0) == 0) {
        const std::string column = CommonUtils::trim(key.substr(5));
        if (column.empty()) throw Survex::ConfigurationException("fill.<column> requires a non-empty column name");
        q.fillDefaults[column] = value;
        return;
    }
    if (key == "mode") {
        const std::string m = CommonUtils::toLower(CommonUtils::trim(value));
        if (m == "extract") mode = RunMode::EXTRACT;
        else if (m == "quality") mode = RunMode::QUALITY;
        else throw Survex::ConfigurationException("mode must be extract or quality: " + value);
        return;
    }
    if (key == "delimiter") {
        if (value.size() != 1) throw Survex::ConfigurationException("delimiter expects a single character");
        delimiter = value[0];
        return;
    }

    if (key == "input") inputPath = value;
    else if (key == "output") outputPath = value;
    else if (key == "report") reportFile = value;
    else if (key == "export_format") exportFormat = CommonUtils::toLower(CommonUtils::trim(value));
    else if (key == "verbose") verbose = parseBoolStrict(value, key);
    else if (key == "anchor_max_scan_rows") ex.anchor.maxScanRows = toSize(parseIntStrict(value, key, 1));
    else if (key == "anchor_default_row") ex.anchor.defaultRow = toSize(parseIntStrict(value, key, 0));
    else if (key == "anchor_min_header_cells") ex.anchor.minHeaderCells = toSize(parseIntStrict(value, key, 1));
    else if (key == "quintile_labels") ex.anchor.quintileLabels = parseListStrict(value, key);
    else if (key == "section_keywords") ex.classifier.sectionKeywords = parseListStrict(value, key);
    else if (key == "section_qualifiers") ex.classifier.sectionQualifiers = parseListStrict(value, key);
    else if (key == "section_max_words") ex.classifier.sectionMaxWords = toSize(parseIntStrict(value, key, 1));
    else if (key == "detail_min_words") ex.classifier.detailMinWords = toSize(parseIntStrict(value, key, 1));
    else if (key == "garbage_keywords") ex.classifier.garbageKeywords = parseListStrict(value, key);
    else if (key == "table_id_tokens") ex.classifier.tableIdTokens = parseListStrict(value, key);
    else if (key == "total_column") ex.totalColumn = value;
    else if (key == "column_names") ex.columnNames = parseListStrict(value, key);
    else if (key == "label_column") ex.labelColumn = value;
    else if (key == "percent_of_total") ex.percentOfTotal = parseBoolStrict(value, key);
    else if (key == "checksum_tolerance") ex.checksumTolerance = parseDoubleStrict(value, key);
    else if (key == "outlier_multiplier") q.outlierMultiplier = parseDoubleStrict(value, key);
    else if (key == "duplicate_key_columns") q.duplicateKeyColumns = parseListStrict(value, key);
    else if (key == "identifier_column") q.identifierColumn = value;
    else if (key == "missing_strategy") q.missingStrategy = CommonUtils::toLower(CommonUtils::trim(value));
    else if (key == "required_columns") q.requiredColumns = parseListStrict(value, key);
    else if (key == "keep") q.keep = CommonUtils::toLower(CommonUtils::trim(value));
    else if (key == "outlier_method") q.outlierMethod = CommonUtils::toLower(CommonUtils::trim(value));
    else if (key == "outlier_columns") q.outlierColumns = parseListStrict(value, key);
    else if (key == "skip_missing") q.skipMissing = parseBoolStrict(value, key);
    else if (key == "skip_duplicates") q.skipDuplicates = parseBoolStrict(value, key);
    else if (key == "skip_outliers") q.skipOutliers = parseBoolStrict(value, key);
    else throw Survex::ConfigurationException("Unknown configuration key: " + rawKey);
}

std::string AutoConfig::usage() {
    return "Usage: survex <extract|quality> <input.csv> [--config path] [--output path] [--report path] "
           "[--export-format none|csv|parquet] [--delimiter ,] [--verbose] "
           "[--anchor-max-scan-rows N] [--anchor-default-row N] [--total-column name] [--column-names a,b,c] "
           "[--percent-of-total true|false] [--checksum-tolerance N] [--outlier-multiplier N] "
           "[--duplicate-key-columns a,b] [--identifier-column name] [--missing-strategy smart|drop|fill_default] "
           "[--keep first|last] [--outlier-method cap|remove|flag] [--outlier-columns a,b] "
           "[--skip-missing true|false] [--skip-duplicates true|false] [--skip-outliers true|false]";
}

AutoConfig AutoConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 3) throw Survex::ConfigurationException(usage());

    AutoConfig config;
    config.set("mode", argv[1]);
    config.inputPath = argv[2];

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 3; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() < 3) {
            throw Survex::ConfigurationException("Unexpected argument: " + arg);
        }
        const std::string key = arg.substr(2);
        const bool hasValue = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
        if (key == "verbose" && !hasValue) {
            overrides.emplace_back(key, "true");
        } else if (!hasValue) {
            throw Survex::ConfigurationException("Missing value for " + arg);
        } else if (key == "config") {
            configPath = argv[++i];
        } else {
            overrides.emplace_back(key, argv[++i]);
        }
    }

    if (!configPath.empty()) {
        const std::string input = config.inputPath;
        const RunMode mode = config.mode;
        config = fromFile(configPath, config);
        config.inputPath = input;
        config.mode = mode;
    }
    // Command-line values override the config file.
    for (const auto& [key, value] : overrides) config.set(key, value);

    config.validate();
    return config;
}

AutoConfig AutoConfig::fromFile(const std::string& configPath, const AutoConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Survex::ConfigurationException("Could not open config file: " + configPath);

    AutoConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Survex::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                 ": expected 'key: value' in '" + line + "'");
        }

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const Survex::SurvexException& ex) {
            throw Survex::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                 ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

void AutoConfig::validate() const {
    if (inputPath.empty()) throw Survex::ConfigurationException("input path is required");

    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!isIn(exportFormat, {"none", "csv", "parquet"})) {
        throw Survex::ConfigurationException("export_format must be one of: none, csv, parquet");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Survex::ConfigurationException("delimiter cannot be a quote or line break");
    }
    if (extraction.anchor.maxScanRows == 0) {
        throw Survex::ConfigurationException("anchor_max_scan_rows must be > 0");
    }
    if (extraction.anchor.quintileLabels.empty()) {
        throw Survex::ConfigurationException("quintile_labels must not be empty");
    }
    if (!(extraction.checksumTolerance >= 0.0)) {
        throw Survex::ConfigurationException("checksum_tolerance must be >= 0");
    }
    if (!(quality.outlierMultiplier > 0.0)) {
        throw Survex::ConfigurationException("outlier_multiplier must be > 0");
    }
    if (CommonUtils::trim(extraction.labelColumn).empty()) {
        throw Survex::ConfigurationException("label_column must not be empty");
    }

    const MissingStrategy strategy = QualityCleaner::parseMissingStrategy(quality.missingStrategy);
    QualityCleaner::parseKeepPolicy(quality.keep);
    QualityCleaner::parseOutlierMethod(quality.outlierMethod);
    if (strategy != MissingStrategy::FILL_DEFAULT && !quality.fillDefaults.empty() && !quality.skipMissing) {
        throw Survex::ConfigurationException("fill.<column> values require missing_strategy: fill_default");
    }
}

std::string AutoConfig::resolvedOutputPath() const {
    if (!outputPath.empty()) return outputPath;
    std::filesystem::path in(inputPath);
    std::filesystem::path out = in.parent_path() / (in.stem().string() + "_clean.csv");
    return out.string();
}
