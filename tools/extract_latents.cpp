// extract_latents.cpp - CLI tool that encodes every entity's decayed history
//
// Pipeline: load_encoder_bundle + read_table -> extract_latents -> CSV.
//
// Usage: ./extract_latents --input <table> --model <path> --cutoff <date> --output <csv>
//            [--alpha 0.1] [--policy drop-cell]

#include "date_utils.hpp"
#include "inference/latent_extractor.hpp"
#include "model/encoder_bundle.hpp"
#include "records/feature_export.hpp"
#include "records/table_reader.hpp"

#include <exception>
#include <iostream>
#include <string>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --model <path> --cutoff <YYYY-MM-DD> --output <csv> [options]\n"
              << "\n"
              << "  --input        Input table (.csv or .parquet)\n"
              << "  --model        Model saved by train_autoencoder\n"
              << "  --cutoff       Date the latents are computed as of\n"
              << "  --output       Output CSV (entity_id, z_0..z_k)\n"
              << "  --alpha        Decay rate per day (default 0.1)\n"
              << "  --policy       drop-cell | drop-row | fill-zero (default drop-cell)\n"
              << "  --id-column    Entity id column name (default entity_id)\n"
              << "  --date-column  Date column name (default date)\n";
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string model_path;
    std::string cutoff_str;
    std::string output_path;
    AggregatorConfig config;
    TableSchema schema;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--model" && i + 1 < argc) {
                model_path = argv[++i];
            } else if (arg == "--cutoff" && i + 1 < argc) {
                cutoff_str = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--alpha" && i + 1 < argc) {
                config.alpha = std::stod(argv[++i]);
            } else if (arg == "--policy" && i + 1 < argc) {
                config.policy = parse_policy(argv[++i]);
            } else if (arg == "--id-column" && i + 1 < argc) {
                schema.id_column = argv[++i];
            } else if (arg == "--date-column" && i + 1 < argc) {
                schema.date_column = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: invalid argument value: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (input_path.empty() || model_path.empty() || cutoff_str.empty() || output_path.empty()) {
        std::cerr << "Missing required argument: --input, --model, --cutoff and --output are required\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        int cutoff = date_utils::parse_date(cutoff_str);
        auto bundle = load_encoder_bundle(model_path);
        auto table = table_reader::read_table(input_path, schema);

        for (const auto& c : bundle.column_names) {
            if (!table.has_column(c)) {
                std::cerr << "WARNING: model column '" << c
                          << "' is absent from the input and will be zero-filled\n";
            }
        }

        auto batch = extract_latents(table, cutoff, config, bundle.model, bundle.column_names);
        std::cout << "Encoded " << batch.size() << " entities (latent dim "
                  << batch.latent_dim() << "), skipped " << batch.skipped.size() << "\n";

        feature_export::write_latents_csv(batch, output_path);
        std::cout << "Wrote " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
