#pragma once

#include "aggregation/pair_builder.hpp"
#include "aggregation/team_form.hpp"
#include "date_utils.hpp"
#include "inference/latent_batch.hpp"
#include "records/arrow_status.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Writers for training sets, latent vectors and team form tables.
//
// Training-set layout (CSV and Parquet):
//   entity_id, x_<col>..., y_<col>...
// ---------------------------------------------------------------------------
namespace feature_export {

namespace detail {

inline void ensure_parent_exists(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }
}

inline std::ofstream open_output(const std::string& path) {
    ensure_parent_exists(path);
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    return file;
}

template <typename T>
std::string format_value(T val) {
    if (std::isnan(val)) return "NaN";
    if (std::isinf(val)) return val > 0 ? "inf" : "-inf";
    std::ostringstream ss;
    ss.precision(17);
    ss << val;
    return ss.str();
}

inline std::string quote_if_needed(const std::string& s) {
    if (s.find_first_of(",\"") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

}  // namespace detail

inline std::vector<std::string> training_set_header(const TrainingSet& set) {
    std::vector<std::string> cols;
    cols.push_back("entity_id");
    for (const auto& c : set.column_names) cols.push_back("x_" + c);
    for (const auto& c : set.column_names) cols.push_back("y_" + c);
    return cols;
}

inline void write_training_set_csv(const TrainingSet& set, const std::string& path) {
    auto file = detail::open_output(path);
    auto header = training_set_header(set);
    for (size_t i = 0; i < header.size(); ++i) {
        if (i) file << ",";
        file << detail::quote_if_needed(header[i]);
    }
    file << "\n";
    for (const auto& pair : set.pairs) {
        file << detail::quote_if_needed(pair.entity_id);
        for (double v : pair.features) file << "," << detail::format_value(v);
        for (double v : pair.target) file << "," << detail::format_value(v);
        file << "\n";
    }
    if (!file) throw std::runtime_error("Failed writing " + path);
}

inline void write_training_set_parquet(const TrainingSet& set, const std::string& path) {
    detail::ensure_parent_exists(path);
    size_t dim = set.column_names.size();

    arrow::FieldVector fields;
    fields.push_back(arrow::field("entity_id", arrow::utf8()));
    for (const auto& c : set.column_names) fields.push_back(arrow::field("x_" + c, arrow::float64()));
    for (const auto& c : set.column_names) fields.push_back(arrow::field("y_" + c, arrow::float64()));
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    {
        arrow::StringBuilder b;
        for (const auto& pair : set.pairs) {
            arrow_status::check(b.Append(pair.entity_id), "Failed to build entity_id column");
        }
        std::shared_ptr<arrow::Array> arr;
        arrow_status::check(b.Finish(&arr), "Failed to build entity_id column");
        arrays.push_back(arr);
    }
    auto add_double_column = [&](size_t c, bool target) {
        arrow::DoubleBuilder b;
        arrow_status::check(b.Reserve(static_cast<int64_t>(set.pairs.size())),
                            "Failed to reserve column");
        for (const auto& pair : set.pairs) {
            b.UnsafeAppend(target ? pair.target[c] : pair.features[c]);
        }
        std::shared_ptr<arrow::Array> arr;
        arrow_status::check(b.Finish(&arr), "Failed to build column " + set.column_names[c]);
        arrays.push_back(arr);
    };
    for (size_t c = 0; c < dim; ++c) add_double_column(c, false);
    for (size_t c = 0; c < dim; ++c) add_double_column(c, true);

    auto table = arrow::Table::Make(schema, arrays);

    auto outfile = arrow_status::unwrap(arrow::io::FileOutputStream::Open(path),
                                        "Cannot open Parquet output file " + path);
    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();
    int64_t chunk_size = std::max<int64_t>(1, static_cast<int64_t>(set.pairs.size()));
    arrow_status::check(
        parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, chunk_size, props),
        "Failed to write Parquet " + path);
    arrow_status::check(outfile->Close(), "Failed to close " + path);
}

// Dispatch on extension: .csv or .parquet.
inline void write_training_set(const TrainingSet& set, const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".csv") return write_training_set_csv(set, path);
    if (ext == ".parquet") return write_training_set_parquet(set, path);
    throw std::invalid_argument("Unsupported output format '" + ext +
                                "'. Use .csv or .parquet extension.");
}

inline void write_latents_csv(const LatentBatch& batch, const std::string& path) {
    auto file = detail::open_output(path);
    file << "entity_id";
    for (size_t k = 0; k < batch.latent_dim(); ++k) file << ",z_" << k;
    file << "\n";
    for (size_t i = 0; i < batch.size(); ++i) {
        file << detail::quote_if_needed(batch.entity_ids[i]);
        for (float v : batch.latents[i]) file << "," << detail::format_value(v);
        file << "\n";
    }
    if (!file) throw std::runtime_error("Failed writing " + path);
}

// Team form rows share one column layout: the union of stat names in first-seen order.
inline void write_team_form_csv(const std::vector<TeamForm>& forms, const std::string& path) {
    std::vector<std::string> stats;
    for (const auto& f : forms) {
        for (const auto& s : f.stat_names) {
            if (std::find(stats.begin(), stats.end(), s) == stats.end()) stats.push_back(s);
        }
    }

    auto file = detail::open_output(path);
    file << "team,form_date,matches_included,points,wins,draws,losses";
    for (const auto& s : stats) file << "," << detail::quote_if_needed(s);
    file << "\n";
    for (const auto& f : forms) {
        file << detail::quote_if_needed(f.team)
             << "," << date_utils::format_date(f.form_date)
             << "," << f.matches_included
             << "," << f.points
             << "," << f.wins
             << "," << f.draws
             << "," << f.losses;
        for (const auto& s : stats) {
            auto v = f.get(s);
            file << "," << (v ? detail::format_value(*v) : "");
        }
        file << "\n";
    }
    if (!file) throw std::runtime_error("Failed writing " + path);
}

}  // namespace feature_export
