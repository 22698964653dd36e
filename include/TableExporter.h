#pragma once

#include "TypedTable.h"

#include <string>
#include <vector>

class TableExporter {
public:
    /**
     * @brief Header plus one record per row; missing cells are empty fields.
     * @details Leveled tables get `level` and `flags` columns after their own columns.
     * The file is written beside the target and renamed into place, so a failed
     * export never leaves a partial file behind.
     * @throws Survex::IOException when the file cannot be written.
     */
    static void writeCSV(const TypedTable& table, const std::string& path, char delimiter = ',');

    /**
     * @brief Writes the CSV and, for format "parquet", a sibling .parquet file.
     * @details Without native Parquet support, or when the Parquet write fails, a warning is
     * printed and the CSV remains the export. Format "none" writes nothing.
     * @return Paths written, CSV first.
     */
    static std::vector<std::string> exportTable(const TypedTable& table,
                                                const std::string& csvPath,
                                                const std::string& format,
                                                char delimiter = ',');

    static std::vector<std::string> headerFor(const TypedTable& table);
    static std::vector<std::string> recordFor(const TypedTable& table, size_t row);

#ifdef SURVEX_USE_NATIVE_PARQUET
    static bool writeParquet(const TypedTable& table, const std::string& path, std::string& errorOut);
#endif
};
