// train_autoencoder.cpp - CLI tool that trains the aggregation autoencoder
//
// Pipeline: read_table -> build_training_set -> train_autoencoder -> save_encoder_bundle.
//
// Usage: ./train_autoencoder --input <table> --cutoff <date> --model <path>
//            [--alpha 0.1] [--policy drop-cell] [--threads 1]
//            [--epochs 200] [--lr 0.001] [--dims 128,64,32]

#include "aggregation/pair_builder.hpp"
#include "date_utils.hpp"
#include "model/autoencoder_training.hpp"
#include "model/encoder_bundle.hpp"
#include "records/table_reader.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --cutoff <YYYY-MM-DD> --model <path> [options]\n"
              << "\n"
              << "  --input        Input table (.csv or .parquet)\n"
              << "  --cutoff       Target date; history is strictly before it\n"
              << "  --model        Output model path (metadata goes to <path>.meta.txt)\n"
              << "  --alpha        Decay rate per day (default 0.1)\n"
              << "  --policy       drop-cell | drop-row | fill-zero (default drop-cell)\n"
              << "  --threads      Worker threads for aggregation (default 1)\n"
              << "  --epochs       Training epochs (default 200)\n"
              << "  --lr           Adam learning rate (default 0.001)\n"
              << "  --dims         Encoder widths, comma-separated (default 128,64,32)\n"
              << "  --id-column    Entity id column name (default entity_id)\n"
              << "  --date-column  Date column name (default date)\n";
}

std::vector<int> parse_dims(const std::string& text) {
    std::vector<int> dims;
    std::istringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) dims.push_back(std::stoi(item));
    return dims;
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string cutoff_str;
    std::string model_path;
    PairBuilderConfig pair_config;
    TrainConfig train_config;
    TableSchema schema;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--cutoff" && i + 1 < argc) {
                cutoff_str = argv[++i];
            } else if (arg == "--model" && i + 1 < argc) {
                model_path = argv[++i];
            } else if (arg == "--alpha" && i + 1 < argc) {
                pair_config.aggregator.alpha = std::stod(argv[++i]);
            } else if (arg == "--policy" && i + 1 < argc) {
                pair_config.aggregator.policy = parse_policy(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                pair_config.num_threads = std::stoi(argv[++i]);
            } else if (arg == "--epochs" && i + 1 < argc) {
                train_config.epochs = std::stoi(argv[++i]);
            } else if (arg == "--lr" && i + 1 < argc) {
                train_config.learning_rate = std::stof(argv[++i]);
            } else if (arg == "--dims" && i + 1 < argc) {
                train_config.encoding_dims = parse_dims(argv[++i]);
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

    if (input_path.empty() || cutoff_str.empty() || model_path.empty()) {
        std::cerr << "Missing required argument: --input, --cutoff and --model are required\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        int cutoff = date_utils::parse_date(cutoff_str);
        auto table = table_reader::read_table(input_path, schema);
        auto set = build_training_set(table, cutoff, pair_config);

        std::cout << "Training set: " << set.size() << " pairs x " << set.dimension()
                  << " columns (skipped: " << set.skipped_no_history << " empty, "
                  << set.skipped_column_mismatch << " column mismatch)\n";
        if (set.empty()) {
            std::cerr << "ERROR: no training pairs for cutoff " << date_utils::format_date(cutoff) << "\n";
            return 1;
        }

        auto [model, result] = make_and_train_autoencoder(set, train_config);
        std::printf("Loss: %.6f -> %.6f over %d epochs\n",
                    result.initial_loss, result.final_loss, train_config.epochs);

        save_encoder_bundle(model, set.column_names, model_path);
        std::cout << "Saved model to " << model_path << " (latent dim "
                  << model->latent_dim() << ")\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
