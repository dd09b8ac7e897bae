// team_form.cpp - CLI tool that summarizes each team's recent form
//
// Pipeline: read_table -> derive_team_columns -> compile_team_form -> CSV.
//
// Usage: ./team_form --input <table> --cutoff <date> --output <csv>
//            [--matches 7] [--alpha 0.1] [--unweighted]

#include "aggregation/team_form.hpp"
#include "date_utils.hpp"
#include "records/feature_export.hpp"
#include "records/table_reader.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --input <path> --cutoff <YYYY-MM-DD> --output <csv> [options]\n"
              << "\n"
              << "  --input        Match table (.csv or .parquet), one row per team per match\n"
              << "  --cutoff       Form is computed from matches strictly before this date\n"
              << "  --output       Output CSV\n"
              << "  --matches      Most recent matches per team (default 7)\n"
              << "  --alpha        Decay rate per day (default 0.1)\n"
              << "  --unweighted   Plain averages instead of decayed averages\n"
              << "  --id-column    Team column name (default team)\n"
              << "  --date-column  Date column name (default date)\n";
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string cutoff_str;
    std::string output_path;
    TeamFormConfig config;
    TableSchema schema;
    schema.id_column = "team";

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--input" && i + 1 < argc) {
                input_path = argv[++i];
            } else if (arg == "--cutoff" && i + 1 < argc) {
                cutoff_str = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--matches" && i + 1 < argc) {
                config.window = std::stoi(argv[++i]);
            } else if (arg == "--alpha" && i + 1 < argc) {
                config.alpha = std::stod(argv[++i]);
            } else if (arg == "--unweighted") {
                config.weighted = false;
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
        auto table = derive_team_columns(table_reader::read_table(input_path, schema));
        auto forms = compile_team_form(table, cutoff, config);

        if (forms.empty()) {
            std::cerr << "WARNING: no team has a match before "
                      << date_utils::format_date(cutoff) << "\n";
        }

        // Summary, best form first.
        std::vector<const TeamForm*> ranked;
        for (const auto& f : forms) ranked.push_back(&f);
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const TeamForm* a, const TeamForm* b) { return a->points > b->points; });
        std::printf("%-24s %4s %3s %3s %3s %8s %8s\n", "team", "pts", "W", "D", "L", "avg_gf", "avg_ga");
        for (const auto* f : ranked) {
            std::printf("%-24s %4d %3d %3d %3d %8.2f %8.2f\n",
                        f->team.c_str(), f->points, f->wins, f->draws, f->losses,
                        f->get("avg_gf").value_or(0.0), f->get("avg_ga").value_or(0.0));
        }

        feature_export::write_team_form_csv(forms, output_path);
        std::cout << "Wrote " << output_path << "\n";
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
