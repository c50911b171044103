#pragma once

#include "analysis/letters_report.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ObservationColumns - names of the columns holding partition, group, value
// ---------------------------------------------------------------------------
struct ObservationColumns {
    std::string partition = "Enzyme";
    std::string group = "Treatment";
    std::string value = "Viability";
};

enum class TableFormat { CSV, PARQUET };

// Format detection by file extension (case-sensitive, as written by our tools).
inline TableFormat detect_table_format(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".csv") return TableFormat::CSV;
    if (ext == ".parquet") return TableFormat::PARQUET;
    throw std::invalid_argument("Unsupported table extension '" + ext + "' for " + path +
                                " (expected .csv or .parquet)");
}

namespace detail {

inline void check_status(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

// Split one CSV record. Double-quoted fields may contain commas; "" is a
// literal quote.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            cells.push_back(cell);
            cell.clear();
        } else if (c != '\r' && c != '\n') {
            cell += c;
        }
    }
    cells.push_back(cell);
    return cells;
}

inline bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::logic_error&) {
        // std::invalid_argument or std::out_of_range from stod
        return false;
    }
}

inline void parse_group_cell(const std::string& text, double& out) {
    if (!parse_double(text, out)) {
        throw std::invalid_argument("Non-numeric group id '" + text + "'");
    }
}

inline void parse_group_cell(const std::string& text, std::string& out) {
    out = text;
}

// Empty cells read as missing (NaN).
inline double parse_value_cell(const std::string& text) {
    if (text.empty()) return std::numeric_limits<double>::quiet_NaN();
    double v = 0.0;
    if (!parse_double(text, v)) {
        throw std::invalid_argument("Non-numeric value '" + text + "'");
    }
    return v;
}

inline std::string format_number(double val) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", val);
    return buf;
}

// Short form for display labels: 0.1 prints as "0.1", not 0.10000000000000001.
inline std::string format_label(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", val);
    return buf;
}

// One cell of an Arrow array as text. Nulls read as "". Floating cells keep
// full precision unless read as labels.
inline std::string arrow_cell_to_string(const std::shared_ptr<arrow::Array>& arr, int64_t i,
                                        bool as_label = false) {
    if (arr->IsNull(i)) return "";
    auto number = [as_label](double v) { return as_label ? format_label(v) : format_number(v); };
    switch (arr->type_id()) {
        case arrow::Type::STRING:
            return std::static_pointer_cast<arrow::StringArray>(arr)->GetString(i);
        case arrow::Type::LARGE_STRING:
            return std::static_pointer_cast<arrow::LargeStringArray>(arr)->GetString(i);
        case arrow::Type::DOUBLE:
            return number(std::static_pointer_cast<arrow::DoubleArray>(arr)->Value(i));
        case arrow::Type::FLOAT:
            return number(std::static_pointer_cast<arrow::FloatArray>(arr)->Value(i));
        case arrow::Type::INT64:
            return std::to_string(std::static_pointer_cast<arrow::Int64Array>(arr)->Value(i));
        case arrow::Type::INT32:
            return std::to_string(std::static_pointer_cast<arrow::Int32Array>(arr)->Value(i));
        case arrow::Type::INT16:
            return std::to_string(std::static_pointer_cast<arrow::Int16Array>(arr)->Value(i));
        case arrow::Type::INT8:
            return std::to_string(std::static_pointer_cast<arrow::Int8Array>(arr)->Value(i));
        case arrow::Type::UINT64:
            return std::to_string(std::static_pointer_cast<arrow::UInt64Array>(arr)->Value(i));
        case arrow::Type::UINT32:
            return std::to_string(std::static_pointer_cast<arrow::UInt32Array>(arr)->Value(i));
        case arrow::Type::UINT16:
            return std::to_string(std::static_pointer_cast<arrow::UInt16Array>(arr)->Value(i));
        case arrow::Type::UINT8:
            return std::to_string(std::static_pointer_cast<arrow::UInt8Array>(arr)->Value(i));
        case arrow::Type::BOOL:
            return std::static_pointer_cast<arrow::BooleanArray>(arr)->Value(i) ? "true" : "false";
        case arrow::Type::DICTIONARY: {
            // pandas categoricals are stored as dictionary-encoded columns
            auto dict = std::static_pointer_cast<arrow::DictionaryArray>(arr);
            return arrow_cell_to_string(dict->dictionary(), dict->GetValueIndex(i), as_label);
        }
        default:
            throw std::invalid_argument("Unsupported column type " + arr->type()->ToString());
    }
}

inline std::vector<std::string> column_cells(const std::shared_ptr<arrow::Table>& table,
                                             const std::string& name, bool as_label = false) {
    auto col = table->GetColumnByName(name);
    if (!col) {
        throw std::invalid_argument("Missing column '" + name + "'");
    }
    std::vector<std::string> cells;
    cells.reserve(static_cast<size_t>(col->length()));
    for (int chunk = 0; chunk < col->num_chunks(); ++chunk) {
        auto arr = col->chunk(chunk);
        for (int64_t i = 0; i < arr->length(); ++i) {
            cells.push_back(arrow_cell_to_string(arr, i, as_label));
        }
    }
    return cells;
}

inline std::shared_ptr<arrow::Table> read_parquet_table(const std::string& path) {
    auto open_result = arrow::io::ReadableFile::Open(path);
    if (!open_result.ok()) {
        throw std::runtime_error("Cannot open Parquet input file: " + path);
    }
    auto reader_result = parquet::arrow::OpenFile(open_result.ValueOrDie(),
                                                  arrow::default_memory_pool());
    check_status(reader_result.status(), "Cannot read Parquet file " + path);
    auto reader = reader_result.MoveValueUnsafe();

    std::shared_ptr<arrow::Table> table;
    check_status(reader->ReadTable(&table), "Failed to read Parquet table " + path);
    return table;
}

// Column-major cells of the partition, group and value columns.
struct RawColumns {
    std::vector<std::string> partition;
    std::vector<std::string> group;
    std::vector<std::string> value;
};

inline RawColumns read_csv_columns(const std::string& path, const ObservationColumns& columns) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open CSV input file: " + path);
    }

    std::string line;
    if (!std::getline(in, line)) {
        throw std::invalid_argument("Empty CSV file: " + path);
    }
    auto header = split_csv_line(line);
    auto index_of = [&](const std::string& name) {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return i;
        }
        throw std::invalid_argument("Missing column '" + name + "' in " + path);
    };
    size_t p_idx = index_of(columns.partition);
    size_t g_idx = index_of(columns.group);
    size_t v_idx = index_of(columns.value);

    RawColumns raw;
    int line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto cells = split_csv_line(line);
        if (cells.size() != header.size()) {
            throw std::invalid_argument(path + ":" + std::to_string(line_no) + ": expected " +
                                        std::to_string(header.size()) + " fields, got " +
                                        std::to_string(cells.size()));
        }
        raw.partition.push_back(cells[p_idx]);
        raw.group.push_back(cells[g_idx]);
        raw.value.push_back(cells[v_idx]);
    }
    return raw;
}

inline RawColumns read_parquet_columns(const std::string& path, const ObservationColumns& columns) {
    auto table = read_parquet_table(path);
    RawColumns raw;
    raw.partition = column_cells(table, columns.partition, /*as_label=*/true);
    raw.group = column_cells(table, columns.group);
    raw.value = column_cells(table, columns.value);
    return raw;
}

inline RawColumns read_raw_columns(const std::string& path, const ObservationColumns& columns) {
    return detect_table_format(path) == TableFormat::CSV ? read_csv_columns(path, columns)
                                                         : read_parquet_columns(path, columns);
}

}  // namespace detail

// True when every non-empty group cell is a number, so groups order by
// numeric value rather than as text.
inline bool group_column_is_numeric(const std::string& path,
                                    const ObservationColumns& columns = {}) {
    if (detect_table_format(path) == TableFormat::PARQUET) {
        auto table = detail::read_parquet_table(path);
        auto field = table->schema()->GetFieldByName(columns.group);
        if (!field) {
            throw std::invalid_argument("Missing column '" + columns.group + "' in " + path);
        }
        auto type = field->type();
        if (type->id() == arrow::Type::DICTIONARY) {
            type = std::static_pointer_cast<arrow::DictionaryType>(type)->value_type();
        }
        // Every type arrow_cell_to_string renders as a number
        switch (type->id()) {
            case arrow::Type::INT8: case arrow::Type::INT16:
            case arrow::Type::INT32: case arrow::Type::INT64:
            case arrow::Type::UINT8: case arrow::Type::UINT16:
            case arrow::Type::UINT32: case arrow::Type::UINT64:
            case arrow::Type::FLOAT: case arrow::Type::DOUBLE:
                return true;
            default:
                return false;
        }
    }

    auto raw = detail::read_csv_columns(path, columns);
    bool any = false;
    for (const auto& cell : raw.group) {
        if (cell.empty()) continue;
        double v = 0.0;
        if (!detail::parse_double(cell, v)) return false;
        any = true;
    }
    return any;
}

// Rows with an empty group cell, or a numeric group id that is NaN or
// infinite, are skipped; empty value cells become NaN.
template <typename G>
std::vector<Observation<G>> read_observations(const std::string& path,
                                              const ObservationColumns& columns = {}) {
    auto raw = detail::read_raw_columns(path, columns);

    std::vector<Observation<G>> observations;
    observations.reserve(raw.value.size());
    for (size_t i = 0; i < raw.value.size(); ++i) {
        if (raw.group[i].empty()) continue;
        Observation<G> obs;
        obs.partition = raw.partition[i];
        detail::parse_group_cell(raw.group[i], obs.group);
        if (is_missing_group(obs.group)) continue;
        obs.value = detail::parse_value_cell(raw.value[i]);
        observations.push_back(std::move(obs));
    }
    return observations;
}
