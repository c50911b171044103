#pragma once

#include "analysis/letters_report.hpp"
#include "io/observation_reader.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Letters table and JSON summary output
// ---------------------------------------------------------------------------

inline const std::vector<std::string>& letters_table_columns() {
    static const std::vector<std::string> cols = {"partition", "group", "letters", "mean", "count"};
    return cols;
}

inline std::string format_group_id(double id) {
    return detail::format_label(id);
}

inline std::string format_group_id(const std::string& id) {
    return id;
}

namespace detail {

inline std::string csv_escape(const std::string& cell) {
    if (cell.find_first_of(",\"\n") == std::string::npos) return cell;
    std::string out = "\"";
    for (char c : cell) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

inline std::string json_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

// JSON has no inf/nan literals.
inline std::string json_number(double val) {
    if (!std::isfinite(val)) return "null";
    return format_number(val);
}

inline void write_json_group(std::ostringstream& ss, double id) {
    ss << json_number(id);
}

inline void write_json_group(std::ostringstream& ss, const std::string& id) {
    ss << "\"" << json_escape(id) << "\"";
}

inline std::shared_ptr<arrow::Array> finish_array(arrow::ArrayBuilder& builder) {
    std::shared_ptr<arrow::Array> arr;
    check_status(builder.Finish(&arr), "Failed to build Arrow array");
    return arr;
}

inline std::shared_ptr<arrow::Array> group_array(const std::vector<double>& ids) {
    arrow::DoubleBuilder b;
    check_status(b.AppendValues(ids), "Failed to append group ids");
    return finish_array(b);
}

inline std::shared_ptr<arrow::Array> group_array(const std::vector<std::string>& ids) {
    arrow::StringBuilder b;
    check_status(b.AppendValues(ids), "Failed to append group ids");
    return finish_array(b);
}

inline std::shared_ptr<arrow::DataType> group_arrow_type(double) { return arrow::float64(); }
inline std::shared_ptr<arrow::DataType> group_arrow_type(const std::string&) { return arrow::utf8(); }

}  // namespace detail

template <typename G>
std::string letters_table_csv(const std::vector<LetterRow<G>>& rows) {
    std::ostringstream ss;
    const auto& cols = letters_table_columns();
    for (size_t i = 0; i < cols.size(); ++i) {
        ss << (i ? "," : "") << cols[i];
    }
    ss << "\n";
    for (const auto& row : rows) {
        ss << detail::csv_escape(row.partition);
        ss << "," << detail::csv_escape(format_group_id(row.group));
        ss << "," << row.letters;
        ss << "," << detail::format_number(row.mean);
        ss << "," << row.count;
        ss << "\n";
    }
    return ss.str();
}

template <typename G>
void write_letters_csv(const std::string& path, const std::vector<LetterRow<G>>& rows) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << letters_table_csv(rows);
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

template <typename G>
void write_letters_parquet(const std::string& path, const std::vector<LetterRow<G>>& rows) {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("partition", arrow::utf8()));
    fields.push_back(arrow::field("group", detail::group_arrow_type(G{})));
    fields.push_back(arrow::field("letters", arrow::utf8()));
    fields.push_back(arrow::field("mean", arrow::float64()));
    fields.push_back(arrow::field("count", arrow::int64()));
    auto schema = arrow::schema(fields);

    std::vector<std::string> partitions, letters;
    std::vector<G> groups;
    std::vector<double> means;
    std::vector<int64_t> counts;
    for (const auto& row : rows) {
        partitions.push_back(row.partition);
        groups.push_back(row.group);
        letters.push_back(row.letters);
        means.push_back(row.mean);
        counts.push_back(row.count);
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    {
        arrow::StringBuilder b;
        detail::check_status(b.AppendValues(partitions), "Failed to append partitions");
        arrays.push_back(detail::finish_array(b));
    }
    arrays.push_back(detail::group_array(groups));
    {
        arrow::StringBuilder b;
        detail::check_status(b.AppendValues(letters), "Failed to append letters");
        arrays.push_back(detail::finish_array(b));
    }
    {
        arrow::DoubleBuilder b;
        detail::check_status(b.AppendValues(means), "Failed to append means");
        arrays.push_back(detail::finish_array(b));
    }
    {
        arrow::Int64Builder b;
        detail::check_status(b.AppendValues(counts), "Failed to append counts");
        arrays.push_back(detail::finish_array(b));
    }

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto num_rows = static_cast<int64_t>(rows.size());
    detail::check_status(
        parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                   /*chunk_size=*/std::max<int64_t>(num_rows, 1), props),
        "Failed to write Parquet " + path);
    detail::check_status(outfile->Close(), "Failed to close Parquet " + path);
}

// Format chosen by extension: .csv or .parquet.
template <typename G>
void write_letters_table(const std::string& path, const std::vector<LetterRow<G>>& rows) {
    if (detect_table_format(path) == TableFormat::CSV) {
        write_letters_csv(path, rows);
    } else {
        write_letters_parquet(path, rows);
    }
}

// Serialize a LettersReport to JSON: config, per-partition omnibus and
// pairwise results, skipped partitions.
template <typename G>
std::string to_json(const LettersReport<G>& report, const LettersReportConfig<G>& cfg) {
    std::ostringstream ss;
    ss << "{";

    ss << "\"config\":{";
    ss << "\"alpha\":" << detail::json_number(cfg.alpha);
    ss << ",\"adjust\":\"" << adjust_method_name(cfg.adjust) << "\"";
    ss << "}";

    ss << ",\"partitions\":[";
    for (size_t p = 0; p < report.partitions.size(); ++p) {
        const auto& part = report.partitions[p];
        if (p) ss << ",";
        ss << "{";
        ss << "\"partition\":\"" << detail::json_escape(part.partition) << "\"";
        ss << ",\"groups\":" << part.group_count;
        ss << ",\"observations\":" << part.observation_count;
        ss << ",\"dropped_nan\":" << part.dropped_nan;
        ss << ",\"kruskal_wallis\":{";
        ss << "\"h\":" << detail::json_number(part.kruskal_wallis.statistic);
        ss << ",\"df\":" << part.kruskal_wallis.df;
        ss << ",\"p_value\":" << detail::json_number(part.kruskal_wallis.p_value);
        ss << "}";

        ss << ",\"comparisons\":[";
        for (size_t i = 0; i < part.comparisons.size(); ++i) {
            const auto& c = part.comparisons[i];
            if (i) ss << ",";
            ss << "{\"first\":";
            detail::write_json_group(ss, c.pair.first);
            ss << ",\"second\":";
            detail::write_json_group(ss, c.pair.second);
            ss << ",\"z\":" << detail::json_number(c.z);
            ss << ",\"raw_p\":" << detail::json_number(c.raw_p_value);
            ss << ",\"adjusted_p\":" << detail::json_number(c.adjusted_p_value);
            ss << "}";
        }
        ss << "]";

        ss << ",\"letters\":{";
        bool first = true;
        for (const auto& row : report.rows) {
            if (row.partition != part.partition) continue;
            if (!first) ss << ",";
            first = false;
            ss << "\"" << detail::json_escape(format_group_id(row.group)) << "\":\""
               << row.letters << "\"";
        }
        ss << "}";

        ss << "}";
    }
    ss << "]";

    ss << ",\"skipped\":[";
    for (size_t i = 0; i < report.skipped_partitions.size(); ++i) {
        const auto& s = report.skipped_partitions[i];
        if (i) ss << ",";
        ss << "{\"partition\":\"" << detail::json_escape(s.partition) << "\"";
        ss << ",\"reason\":\"" << detail::json_escape(s.reason) << "\"}";
    }
    ss << "]";

    ss << "}";
    return ss.str();
}

template <typename G>
void write_json_summary(const std::string& path, const LettersReport<G>& report,
                        const LettersReportConfig<G>& cfg) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open summary file: " + path);
    }
    out << to_json(report, cfg) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write summary file: " + path);
    }
}
