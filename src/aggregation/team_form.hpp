#pragma once

#include "aggregation/aggregator.hpp"
#include "aggregation/temporal_weight.hpp"
#include "records/observation_table.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TeamFormConfig
// ---------------------------------------------------------------------------
struct TeamFormConfig {
    double alpha = DEFAULT_ALPHA;
    int window = 7;         // most recent matches considered
    bool weighted = true;   // false: plain mean over the window
};

// ---------------------------------------------------------------------------
// TeamForm - recent-form summary of one team as of a cutoff
// ---------------------------------------------------------------------------
struct TeamForm {
    std::string team;
    int form_date = 0;
    int matches_included = 0;
    std::vector<std::string> stat_names;   // "avg_<column>"
    std::vector<double> stat_values;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int points = 0;

    std::optional<double> get(const std::string& name) const {
        for (size_t i = 0; i < stat_names.size(); ++i) {
            if (stat_names[i] == name) return stat_values[i];
        }
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// derive_team_columns - append goal_diff, shot_accuracy, pk_conversion
//
// Each derived column is added only when its source columns exist. Returns a
// new table; `table` is not modified.
// ---------------------------------------------------------------------------
inline ObservationTable derive_team_columns(const ObservationTable& table) {
    ObservationTable out = table;

    auto ratio_or_zero = [](double num, double den) {
        if (!std::isfinite(num) || !std::isfinite(den)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return den > 0.0 ? num / den : 0.0;
    };

    if (out.has_column("gf") && out.has_column("ga") && !out.has_column("goal_diff")) {
        out = out.with_column("goal_diff", [](const ObservationTable& t, const ObservationRow& r) {
            return t.value(r, "gf") - t.value(r, "ga");
        });
    }
    if (out.has_column("sot") && out.has_column("sh") && !out.has_column("shot_accuracy")) {
        out = out.with_column("shot_accuracy", [&](const ObservationTable& t, const ObservationRow& r) {
            return ratio_or_zero(t.value(r, "sot"), t.value(r, "sh"));
        });
    }
    if (out.has_column("pk") && out.has_column("pkatt") && !out.has_column("pk_conversion")) {
        out = out.with_column("pk_conversion", [&](const ObservationTable& t, const ObservationRow& r) {
            return ratio_or_zero(t.value(r, "pk"), t.value(r, "pkatt"));
        });
    }
    return out;
}

// ---------------------------------------------------------------------------
// recent_form_rows - the `window` most recent rows strictly before cutoff,
// returned oldest first. Same-date rows keep their input order.
// ---------------------------------------------------------------------------
inline std::vector<ObservationRow> recent_form_rows(const std::vector<ObservationRow>& rows,
                                                    int cutoff,
                                                    int window) {
    if (window <= 0) {
        throw std::invalid_argument("Form window must be positive, got " + std::to_string(window));
    }
    std::vector<ObservationRow> before;
    for (const auto& r : rows) {
        if (r.date < cutoff) before.push_back(r);
    }
    std::stable_sort(before.begin(), before.end(),
                     [](const ObservationRow& a, const ObservationRow& b) { return a.date < b.date; });
    if (static_cast<int>(before.size()) > window) {
        before.erase(before.begin(), before.end() - window);
    }
    return before;
}

// ---------------------------------------------------------------------------
// aggregate_team_form - decayed (or plain) averages plus W/D/L over a window
//
// Weighting uses the same age = cutoff - date convention as DecayAggregator.
// Returns std::nullopt when the team has no match before the cutoff.
// ---------------------------------------------------------------------------
inline std::optional<TeamForm> aggregate_team_form(const ObservationTable& table,
                                                   const std::vector<ObservationRow>& rows,
                                                   int cutoff,
                                                   const TeamFormConfig& config = {}) {
    auto form_rows = recent_form_rows(rows, cutoff, config.window);
    if (form_rows.empty()) return std::nullopt;

    TeamForm form;
    form.team = form_rows.front().entity_id;
    form.form_date = cutoff;
    form.matches_included = static_cast<int>(form_rows.size());

    if (config.weighted) {
        DecayAggregator aggregator(AggregatorConfig{config.alpha, MissingValuePolicy::DROP_CELL});
        auto agg = aggregator.aggregate(table, form_rows, cutoff);
        if (agg) {
            for (size_t i = 0; i < agg->column_names.size(); ++i) {
                form.stat_names.push_back("avg_" + agg->column_names[i]);
                form.stat_values.push_back(agg->values[i]);
            }
        }
    } else {
        for (size_t c = 0; c < table.num_columns(); ++c) {
            if (table.is_reserved(table.column_names()[c])) continue;
            double sum = 0.0;
            int count = 0;
            for (const auto& r : form_rows) {
                if (!std::isfinite(r.values[c])) continue;
                sum += r.values[c];
                ++count;
            }
            if (count == 0) continue;
            form.stat_names.push_back("avg_" + table.column_names()[c]);
            form.stat_values.push_back(sum / count);
        }
    }

    if (table.has_column("gf") && table.has_column("ga")) {
        for (const auto& r : form_rows) {
            double gf = table.value(r, "gf");
            double ga = table.value(r, "ga");
            if (!std::isfinite(gf) || !std::isfinite(ga)) continue;
            if (gf > ga) ++form.wins;
            else if (gf < ga) ++form.losses;
            else ++form.draws;
        }
    }
    form.points = 3 * form.wins + form.draws;
    return form;
}

// ---------------------------------------------------------------------------
// compile_team_form - TeamForm for every team with a match before cutoff,
// sorted by team id.
// ---------------------------------------------------------------------------
inline std::vector<TeamForm> compile_team_form(const ObservationTable& table,
                                               int cutoff,
                                               const TeamFormConfig& config = {}) {
    std::vector<TeamForm> forms;
    for (const auto& [team, rows] : table.group_by_entity()) {
        auto form = aggregate_team_form(table, rows, cutoff, config);
        if (form) forms.push_back(std::move(*form));
    }
    return forms;
}
