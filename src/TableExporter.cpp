#include "TableExporter.h"
#include "CSVUtils.h"
#include "SurvexExceptions.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#ifdef SURVEX_USE_NATIVE_PARQUET
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

std::vector<std::string> TableExporter::headerFor(const TypedTable& table) {
    std::vector<std::string> header;
    for (const auto& col : table.columns()) header.push_back(col.name);
    if (table.hasRowMeta()) {
        header.push_back("level");
        header.push_back("flags");
    }
    return header;
}

std::vector<std::string> TableExporter::recordFor(const TypedTable& table, size_t row) {
    std::vector<std::string> record;
    record.reserve(table.colCount() + 2);
    for (size_t c = 0; c < table.colCount(); ++c) record.push_back(table.cellText(row, c));
    if (table.hasRowMeta()) {
        const auto& meta = table.rowMeta()[row];
        record.push_back(rowLevelName(meta.level));
        CellFlags flags;
        for (const auto& col : table.columns()) {
            if (!col.flags.empty()) flags.merge(col.flags[row]);
        }
        record.push_back(cellFlagsName(flags));
    }
    return record;
}

void TableExporter::writeCSV(const TypedTable& table, const std::string& path, char delimiter) {
    namespace fs = std::filesystem;
    const fs::path target(path);
    std::error_code ec;
    if (!target.parent_path().empty()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) throw Survex::IOException("Could not create output directory " + target.parent_path().string() + ": " + ec.message());
    }

    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary);
        if (!out) throw Survex::IOException("Could not open output file: " + tmpPath);
        CSVUtils::writeRecord(out, headerFor(table), delimiter);
        for (size_t r = 0; r < table.rowCount(); ++r) CSVUtils::writeRecord(out, recordFor(table, r), delimiter);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmpPath, ec);
            throw Survex::IOException("Failed while writing " + tmpPath);
        }
    }
    fs::rename(tmpPath, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw Survex::IOException("Could not move export into place at " + path + ": " + ec.message());
    }
}

#ifdef SURVEX_USE_NATIVE_PARQUET
bool TableExporter::writeParquet(const TypedTable& table, const std::string& path, std::string& errorOut) {
    std::vector<std::shared_ptr<arrow::Field>> fields;
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    const size_t rows = table.rowCount();

    auto finish = [&](arrow::ArrayBuilder& builder, const std::string& name, std::shared_ptr<arrow::DataType> type) {
        std::shared_ptr<arrow::Array> arr;
        const auto status = builder.Finish(&arr);
        if (!status.ok()) {
            errorOut = "Failed to finalize Arrow array for column '" + name + "': " + status.ToString();
            return false;
        }
        fields.push_back(arrow::field(name, std::move(type), true));
        arrays.push_back(arr);
        return true;
    };

    for (const auto& col : table.columns()) {
        arrow::Status status;
        if (col.type == ColumnType::NUMERIC) {
            arrow::DoubleBuilder builder;
            const auto& vals = std::get<std::vector<double>>(col.values);
            for (size_t r = 0; r < rows && status.ok(); ++r) {
                status = col.missing[r] ? builder.AppendNull() : builder.Append(vals[r]);
            }
            if (!status.ok()) {
                errorOut = "Failed to append value for column '" + col.name + "': " + status.ToString();
                return false;
            }
            if (!finish(builder, col.name, arrow::float64())) return false;
        } else if (col.type == ColumnType::BOOLEAN) {
            arrow::BooleanBuilder builder;
            const auto& vals = std::get<std::vector<uint8_t>>(col.values);
            for (size_t r = 0; r < rows && status.ok(); ++r) {
                status = col.missing[r] ? builder.AppendNull() : builder.Append(vals[r] != 0);
            }
            if (!status.ok()) {
                errorOut = "Failed to append value for column '" + col.name + "': " + status.ToString();
                return false;
            }
            if (!finish(builder, col.name, arrow::boolean())) return false;
        } else {
            arrow::StringBuilder builder;
            const auto& vals = std::get<std::vector<std::string>>(col.values);
            for (size_t r = 0; r < rows && status.ok(); ++r) {
                status = col.missing[r] ? builder.AppendNull() : builder.Append(vals[r]);
            }
            if (!status.ok()) {
                errorOut = "Failed to append value for column '" + col.name + "': " + status.ToString();
                return false;
            }
            if (!finish(builder, col.name, arrow::utf8())) return false;
        }
    }

    if (table.hasRowMeta()) {
        arrow::StringBuilder levels;
        arrow::Status status;
        for (size_t r = 0; r < rows && status.ok(); ++r) status = levels.Append(rowLevelName(table.rowMeta()[r].level));
        if (!status.ok()) {
            errorOut = "Failed to append level column: " + status.ToString();
            return false;
        }
        if (!finish(levels, "level", arrow::utf8())) return false;
    }

    auto schema = std::make_shared<arrow::Schema>(fields);
    auto arrowTable = arrow::Table::Make(schema, arrays, static_cast<int64_t>(rows));

    auto outRes = arrow::io::FileOutputStream::Open(path);
    if (!outRes.ok()) {
        errorOut = "Failed to open parquet output path: " + outRes.status().ToString();
        return false;
    }
    std::shared_ptr<arrow::io::FileOutputStream> sink = outRes.ValueOrDie();

    const int64_t chunkRows = std::max<int64_t>(1024, std::min<int64_t>(65536, static_cast<int64_t>(rows)));
    auto writeStatus = parquet::arrow::WriteTable(*arrowTable, arrow::default_memory_pool(), sink, chunkRows);
    if (!writeStatus.ok()) {
        errorOut = "Parquet write failed: " + writeStatus.ToString();
        return false;
    }
    auto closeStatus = sink->Close();
    if (!closeStatus.ok()) {
        errorOut = "Failed to close parquet output stream: " + closeStatus.ToString();
        return false;
    }
    return true;
}
#endif

std::vector<std::string> TableExporter::exportTable(const TypedTable& table,
                                                    const std::string& csvPath,
                                                    const std::string& format,
                                                    char delimiter) {
    std::vector<std::string> written;
    if (format == "none") return written;

    writeCSV(table, csvPath, delimiter);
    written.push_back(csvPath);
    std::cout << "[Survex][Export] Wrote " << table.rowCount() << " rows to " << csvPath << "\n";

    if (format == "parquet") {
#ifdef SURVEX_USE_NATIVE_PARQUET
        const std::string parquetPath = std::filesystem::path(csvPath).replace_extension(".parquet").string();
        std::string parquetError;
        if (writeParquet(table, parquetPath, parquetError)) {
            written.push_back(parquetPath);
            std::cout << "[Survex][Export] Wrote " << parquetPath << "\n";
        } else {
            std::cout << "[Survex][Warning] Native parquet export failed: " << parquetError
                      << ". CSV export is available at " << csvPath << "\n";
        }
#else
        std::cout << "[Survex][Warning] Parquet export requested, but this build was compiled without native parquet support. "
                  << "Rebuild with Arrow/Parquet libraries enabled. CSV export is available at " << csvPath << "\n";
#endif
    }
    return written;
}
