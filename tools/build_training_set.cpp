// build_training_set.cpp - CLI tool that pairs decayed history with outcomes
//
// Pipeline: read_table -> build_training_set -> CSV / Parquet.
//
// Usage: ./build_training_set --input <table> --cutoff <date> --output <path>
//            [--alpha 0.1] [--policy drop-cell] [--threads 1]
//            [--id-column entity_id] [--date-column date]

#include "aggregation/pair_builder.hpp"
#include "date_utils.hpp"
#include "records/feature_export.hpp"
#include "records/table_reader.hpp"

#include <exception>
#include <iostream>
#include <string>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --cutoff <YYYY-MM-DD> --output <path> [options]\n"
              << "\n"
              << "  --input        Input table (.csv or .parquet)\n"
              << "  --cutoff       Target date; history is strictly before it\n"
              << "  --output       Output training set (.csv or .parquet)\n"
              << "  --alpha        Decay rate per day (default 0.1)\n"
              << "  --policy       drop-cell | drop-row | fill-zero (default drop-cell)\n"
              << "  --threads      Worker threads for aggregation (default 1)\n"
              << "  --id-column    Entity id column name (default entity_id)\n"
              << "  --date-column  Date column name (default date)\n";
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string cutoff_str;
    std::string output_path;
    PairBuilderConfig config;
    TableSchema schema;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--cutoff" && i + 1 < argc) {
                cutoff_str = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--alpha" && i + 1 < argc) {
                config.aggregator.alpha = std::stod(argv[++i]);
            } else if (arg == "--policy" && i + 1 < argc) {
                config.aggregator.policy = parse_policy(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                config.num_threads = std::stoi(argv[++i]);
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

    if (input_path.empty() || cutoff_str.empty() || output_path.empty()) {
        std::cerr << "Missing required argument: --input, --cutoff and --output are required\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        int cutoff = date_utils::parse_date(cutoff_str);

        std::cout << "Reading " << input_path << "...\n";
        auto table = table_reader::read_table(input_path, schema);
        std::cout << "  " << table.num_rows() << " rows, " << table.num_columns()
                  << " feature columns, " << table.entity_ids().size() << " entities\n";

        auto set = build_training_set(table, cutoff, config);

        std::cout << "Cutoff " << date_utils::format_date(cutoff)
                  << " (alpha=" << config.aggregator.alpha
                  << ", policy=" << policy_name(config.aggregator.policy) << ")\n";
        std::cout << "  eligible entities:        " << set.eligible_entities << "\n";
        std::cout << "  excluded (no history):    " << set.excluded_no_history << "\n";
        std::cout << "  excluded (no label):      " << set.excluded_no_label << "\n";
        std::cout << "  skipped (empty aggregate): " << set.skipped_no_history << "\n";
        std::cout << "  skipped (column mismatch): " << set.skipped_column_mismatch << "\n";
        std::cout << "  pairs: " << set.size() << " x " << set.dimension() << " columns\n";

        if (set.empty()) {
            std::cerr << "WARNING: training set is empty\n";
        }

        feature_export::write_training_set(set, output_path);
        std::cout << "Wrote " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
