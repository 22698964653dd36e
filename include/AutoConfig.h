#pragma once

#include "RowClassifier.h"
#include "TableLocator.h"

#include <map>
#include <string>
#include <vector>

enum class RunMode { EXTRACT, QUALITY };

struct ExtractionConfig {
    AnchorRules anchor;
    ClassifierRules classifier;

    // Header text of the total column; empty selects the last value column.
    std::string totalColumn;
    // Replaces the header-row names of the value columns, in order.
    std::vector<std::string> columnNames;
    std::string labelColumn = "item";
    bool percentOfTotal = false;
    double checksumTolerance = 2.0;
};

struct QualityConfig {
    double outlierMultiplier = 1.5;
    std::vector<std::string> duplicateKeyColumns;
    std::string identifierColumn;

    std::string missingStrategy = "smart";  // smart|drop|fill_default
    std::vector<std::string> requiredColumns;
    std::map<std::string, std::string> fillDefaults;
    std::string keep = "first";             // first|last
    std::string outlierMethod = "cap";      // cap|remove|flag
    std::vector<std::string> outlierColumns;

    bool skipMissing = false;
    bool skipDuplicates = false;
    bool skipOutliers = false;
};

struct AutoConfig {
    RunMode mode = RunMode::EXTRACT;
    std::string inputPath;
    std::string outputPath;                 // empty: <input stem>_clean.csv
    std::string reportFile = "survex_quality_report.md";
    std::string exportFormat = "csv";       // none|csv|parquet
    char delimiter = ',';
    bool verbose = false;

    ExtractionConfig extraction;
    QualityConfig quality;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the mode (extract|quality) and argv[2] the input path.
     * @post Returns a validated config object.
     * @throws Survex::ConfigurationException on invalid arguments or values.
     */
    static AutoConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Survex::ConfigurationException on unreadable files, unknown keys or invalid values.
     */
    static AutoConfig fromFile(const std::string& configPath, const AutoConfig& base);

    /**
     * @brief Applies one `key: value` setting; keys use snake_case.
     * @throws Survex::ConfigurationException for unknown keys or malformed values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Validates merged configuration invariants and enum-like fields.
     * @throws Survex::ConfigurationException on invalid values.
     */
    void validate() const;

    std::string resolvedOutputPath() const;
    static std::string usage();
};
