#pragma once

// encoder_bundle.hpp - persist a trained autoencoder with its feature layout
//
//   <path>           torch::save archive of the module parameters
//   <path>.meta.txt  encoding dims and the ordered feature column names
//
// The column list is what the inference path must request from the
// aggregator so latent extraction sees the layout the model was trained on.

#include "model/autoencoder.hpp"

#include <torch/torch.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

struct EncoderBundle {
    AggregationAutoencoder model{nullptr};
    std::vector<std::string> column_names;
};

inline std::string bundle_meta_path(const std::string& path) {
    return path + ".meta.txt";
}

inline void save_encoder_bundle(AggregationAutoencoder& model,
                                const std::vector<std::string>& column_names,
                                const std::string& path) {
    if (static_cast<int>(column_names.size()) != model->input_dim()) {
        throw std::invalid_argument("Column list has " + std::to_string(column_names.size()) +
                                    " names but the model expects " +
                                    std::to_string(model->input_dim()));
    }
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        throw std::runtime_error("Output directory does not exist: " + parent.string());
    }

    torch::save(model, path);

    std::ofstream meta(bundle_meta_path(path));
    if (!meta.is_open()) {
        throw std::runtime_error("Cannot open output file: " + bundle_meta_path(path));
    }
    meta << "encoding_dims";
    for (int d : model->encoding_dims()) meta << " " << d;
    meta << "\n";
    meta << "columns " << column_names.size() << "\n";
    for (const auto& c : column_names) meta << c << "\n";
    if (!meta) throw std::runtime_error("Failed writing " + bundle_meta_path(path));
}

inline EncoderBundle load_encoder_bundle(const std::string& path) {
    std::ifstream meta(bundle_meta_path(path));
    if (!meta.is_open()) {
        throw std::runtime_error("Cannot open model metadata: " + bundle_meta_path(path));
    }

    std::string line;
    std::string key;
    std::vector<int> dims;
    if (!std::getline(meta, line)) {
        throw std::runtime_error("Model metadata is empty: " + bundle_meta_path(path));
    }
    {
        std::istringstream ss(line);
        ss >> key;
        if (key != "encoding_dims") {
            throw std::runtime_error("Malformed model metadata (encoding_dims): " + line);
        }
        int d = 0;
        while (ss >> d) dims.push_back(d);
    }

    size_t n_columns = 0;
    if (!std::getline(meta, line)) {
        throw std::runtime_error("Model metadata lacks a column count: " + bundle_meta_path(path));
    }
    {
        std::istringstream ss(line);
        ss >> key >> n_columns;
        if (key != "columns" || ss.fail()) {
            throw std::runtime_error("Malformed model metadata (columns): " + line);
        }
    }

    EncoderBundle bundle;
    while (bundle.column_names.size() < n_columns && std::getline(meta, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        bundle.column_names.push_back(line);
    }
    if (bundle.column_names.size() != n_columns) {
        throw std::runtime_error("Model metadata lists " + std::to_string(bundle.column_names.size()) +
                                 " of " + std::to_string(n_columns) + " columns");
    }

    bundle.model = AggregationAutoencoder(static_cast<int>(n_columns), dims);
    torch::load(bundle.model, path);
    bundle.model->eval();
    return bundle;
}
