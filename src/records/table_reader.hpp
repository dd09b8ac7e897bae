#pragma once

#include "date_utils.hpp"
#include "records/arrow_status.hpp"
#include "records/observation_table.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Readers for the per-entity, per-date input table.
//
// Both formats need the schema's id and date columns; every other numeric
// column is a feature and text-only columns are skipped with a warning.
// Missing cells become NaN.
// ---------------------------------------------------------------------------
namespace table_reader {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

// Split one CSV line. Double-quoted fields may contain commas; "" is a quote.
inline std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r' && c != '\n') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Parse a feature cell. Empty / NaN / NA -> NaN; inf and -inf are kept.
inline std::optional<double> parse_cell(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty() || s == "NaN" || s == "nan" || s == "NA" || s == "null") return NaN;
    if (s == "inf" || s == "Inf" || s == "+inf") return std::numeric_limits<double>::infinity();
    if (s == "-inf" || s == "-Inf") return -std::numeric_limits<double>::infinity();

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
    return v;
}

inline ObservationTable read_csv(const std::string& path, const TableSchema& schema = {}) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::invalid_argument("Input file is empty: " + path);
    }
    auto header = split_csv_line(line);
    for (auto& h : header) h = trim(h);

    int id_idx = -1;
    int date_idx = -1;
    std::vector<int> candidate_idx;
    for (int i = 0; i < static_cast<int>(header.size()); ++i) {
        if (header[i] == schema.id_column) {
            id_idx = i;
        } else if (header[i] == schema.date_column) {
            date_idx = i;
        } else {
            candidate_idx.push_back(i);
        }
    }
    if (id_idx < 0) {
        throw std::invalid_argument("Input table " + path + " has no id column '" +
                                    schema.id_column + "'");
    }
    if (date_idx < 0) {
        throw std::invalid_argument("Input table " + path + " has no date column '" +
                                    schema.date_column + "'");
    }

    std::vector<std::vector<std::string>> records;
    std::vector<int> line_numbers;
    int line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto fields = split_csv_line(line);
        if (fields.size() != header.size()) {
            throw std::invalid_argument(path + ":" + std::to_string(line_no) + ": expected " +
                                        std::to_string(header.size()) + " fields, got " +
                                        std::to_string(fields.size()));
        }
        records.push_back(std::move(fields));
        line_numbers.push_back(line_no);
    }

    // A column whose non-missing cells are all text (opponent, venue, ...) is
    // skipped like a non-numeric Parquet column. A column mixing numbers and
    // text is malformed.
    std::vector<std::string> feature_names;
    std::vector<int> feature_idx;
    for (int i : candidate_idx) {
        bool any_numeric = false;
        bool any_text = false;
        for (const auto& fields : records) {
            auto v = parse_cell(fields[i]);
            if (!v) any_text = true;
            else if (!std::isnan(*v)) any_numeric = true;
        }
        if (any_text && !any_numeric) {
            std::cerr << "WARNING: skipping non-numeric column '" << header[i] << "' in "
                      << path << "\n";
            continue;
        }
        feature_names.push_back(header[i]);
        feature_idx.push_back(i);
    }

    ObservationTable table(feature_names, schema);
    for (size_t r = 0; r < records.size(); ++r) {
        const auto& fields = records[r];
        std::string where = path + ":" + std::to_string(line_numbers[r]);

        ObservationRow row;
        row.entity_id = trim(fields[id_idx]);
        try {
            row.date = date_utils::parse_date(trim(fields[date_idx]));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(where + ": " + e.what());
        }
        row.values.reserve(feature_idx.size());
        for (size_t f = 0; f < feature_idx.size(); ++f) {
            auto v = parse_cell(fields[feature_idx[f]]);
            if (!v) {
                throw std::invalid_argument(where + ": non-numeric value '" +
                                            fields[feature_idx[f]] + "' in column '" +
                                            feature_names[f] + "'");
            }
            row.values.push_back(*v);
        }
        table.add_row(std::move(row));
    }
    return table;
}

namespace detail {

template <typename ArrayType>
void append_numeric(const arrow::Array& chunk, std::vector<double>& out) {
    const auto& arr = static_cast<const ArrayType&>(chunk);
    for (int64_t i = 0; i < arr.length(); ++i) {
        out.push_back(arr.IsNull(i) ? NaN : static_cast<double>(arr.Value(i)));
    }
}

// Widen a numeric column to doubles; std::nullopt for non-numeric types.
inline std::optional<std::vector<double>> column_to_doubles(const arrow::ChunkedArray& column) {
    std::vector<double> out;
    out.reserve(static_cast<size_t>(column.length()));
    for (const auto& chunk : column.chunks()) {
        switch (chunk->type_id()) {
            case arrow::Type::DOUBLE: append_numeric<arrow::DoubleArray>(*chunk, out); break;
            case arrow::Type::FLOAT:  append_numeric<arrow::FloatArray>(*chunk, out); break;
            case arrow::Type::INT8:   append_numeric<arrow::Int8Array>(*chunk, out); break;
            case arrow::Type::INT16:  append_numeric<arrow::Int16Array>(*chunk, out); break;
            case arrow::Type::INT32:  append_numeric<arrow::Int32Array>(*chunk, out); break;
            case arrow::Type::INT64:  append_numeric<arrow::Int64Array>(*chunk, out); break;
            case arrow::Type::UINT8:  append_numeric<arrow::UInt8Array>(*chunk, out); break;
            case arrow::Type::UINT16: append_numeric<arrow::UInt16Array>(*chunk, out); break;
            case arrow::Type::UINT32: append_numeric<arrow::UInt32Array>(*chunk, out); break;
            case arrow::Type::UINT64: append_numeric<arrow::UInt64Array>(*chunk, out); break;
            case arrow::Type::BOOL: {
                const auto& arr = static_cast<const arrow::BooleanArray&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    out.push_back(arr.IsNull(i) ? NaN : (arr.Value(i) ? 1.0 : 0.0));
                }
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

inline std::vector<std::string> column_to_ids(const arrow::ChunkedArray& column,
                                              const std::string& name) {
    std::vector<std::string> out;
    out.reserve(static_cast<size_t>(column.length()));
    for (const auto& chunk : column.chunks()) {
        if (chunk->type_id() == arrow::Type::STRING) {
            const auto& arr = static_cast<const arrow::StringArray&>(*chunk);
            for (int64_t i = 0; i < arr.length(); ++i) {
                out.push_back(arr.IsNull(i) ? "" : arr.GetString(i));
            }
        } else if (chunk->type_id() == arrow::Type::LARGE_STRING) {
            const auto& arr = static_cast<const arrow::LargeStringArray&>(*chunk);
            for (int64_t i = 0; i < arr.length(); ++i) {
                out.push_back(arr.IsNull(i) ? "" : arr.GetString(i));
            }
        } else if (chunk->type_id() == arrow::Type::INT64) {
            const auto& arr = static_cast<const arrow::Int64Array&>(*chunk);
            for (int64_t i = 0; i < arr.length(); ++i) {
                out.push_back(arr.IsNull(i) ? "" : std::to_string(arr.Value(i)));
            }
        } else if (chunk->type_id() == arrow::Type::INT32) {
            const auto& arr = static_cast<const arrow::Int32Array&>(*chunk);
            for (int64_t i = 0; i < arr.length(); ++i) {
                out.push_back(arr.IsNull(i) ? "" : std::to_string(arr.Value(i)));
            }
        } else {
            throw std::invalid_argument("Id column '" + name + "' has unsupported type " +
                                        chunk->type()->ToString());
        }
    }
    return out;
}

inline std::vector<int> column_to_dates(const arrow::ChunkedArray& column,
                                        const std::string& name) {
    std::vector<int> out;
    out.reserve(static_cast<size_t>(column.length()));
    auto check_valid = [&name](int d) {
        if (!date_utils::is_valid_date(d)) {
            throw std::invalid_argument("Date column '" + name + "' holds invalid date " +
                                        std::to_string(d));
        }
        return d;
    };
    for (const auto& chunk : column.chunks()) {
        if (chunk->null_count() > 0) {
            throw std::invalid_argument("Date column '" + name + "' contains nulls");
        }
        switch (chunk->type_id()) {
            case arrow::Type::DATE32: {
                const auto& arr = static_cast<const arrow::Date32Array&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    out.push_back(date_utils::from_day_number(arr.Value(i)));
                }
                break;
            }
            case arrow::Type::INT32: {
                const auto& arr = static_cast<const arrow::Int32Array&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) out.push_back(check_valid(arr.Value(i)));
                break;
            }
            case arrow::Type::INT64: {
                const auto& arr = static_cast<const arrow::Int64Array&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    out.push_back(check_valid(static_cast<int>(arr.Value(i))));
                }
                break;
            }
            case arrow::Type::STRING: {
                const auto& arr = static_cast<const arrow::StringArray&>(*chunk);
                for (int64_t i = 0; i < arr.length(); ++i) {
                    out.push_back(date_utils::parse_date(arr.GetString(i)));
                }
                break;
            }
            default:
                throw std::invalid_argument("Date column '" + name + "' has unsupported type " +
                                            chunk->type()->ToString());
        }
    }
    return out;
}

}  // namespace detail

inline ObservationTable read_parquet(const std::string& path, const TableSchema& schema = {}) {
    auto input = arrow_status::unwrap(arrow::io::ReadableFile::Open(path),
                                      "Cannot open input file " + path);
    auto reader = arrow_status::unwrap(
        parquet::arrow::OpenFile(input, arrow::default_memory_pool()),
        "Cannot read Parquet file " + path);

    std::shared_ptr<arrow::Table> table;
    arrow_status::check(reader->ReadTable(&table), "Failed to read Parquet table " + path);

    auto id_col = table->GetColumnByName(schema.id_column);
    if (!id_col) {
        throw std::invalid_argument("Input table " + path + " has no id column '" +
                                    schema.id_column + "'");
    }
    auto date_col = table->GetColumnByName(schema.date_column);
    if (!date_col) {
        throw std::invalid_argument("Input table " + path + " has no date column '" +
                                    schema.date_column + "'");
    }

    auto ids = detail::column_to_ids(*id_col, schema.id_column);
    auto dates = detail::column_to_dates(*date_col, schema.date_column);

    std::vector<std::string> feature_names;
    std::vector<std::vector<double>> features;
    for (int i = 0; i < table->num_columns(); ++i) {
        const auto& name = table->field(i)->name();
        if (name == schema.id_column || name == schema.date_column) continue;
        auto values = detail::column_to_doubles(*table->column(i));
        if (!values) {
            std::cerr << "WARNING: skipping non-numeric column '" << name << "' ("
                      << table->field(i)->type()->ToString() << ") in " << path << "\n";
            continue;
        }
        feature_names.push_back(name);
        features.push_back(std::move(*values));
    }

    ObservationTable out(feature_names, schema);
    for (int64_t r = 0; r < table->num_rows(); ++r) {
        ObservationRow row;
        row.entity_id = ids[r];
        row.date = dates[r];
        row.values.reserve(features.size());
        for (const auto& col : features) row.values.push_back(col[r]);
        out.add_row(std::move(row));
    }
    return out;
}

// Dispatch on extension: .csv or .parquet.
inline ObservationTable read_table(const std::string& path, const TableSchema& schema = {}) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".csv") return read_csv(path, schema);
    if (ext == ".parquet") return read_parquet(path, schema);
    throw std::invalid_argument("Unsupported input format '" + ext +
                                "'. Use .csv or .parquet extension.");
}

}  // namespace table_reader
