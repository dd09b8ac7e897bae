#pragma once

#include "aggregation/temporal_weight.hpp"
#include "date_utils.hpp"
#include "records/observation_table.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MissingValuePolicy - treatment of NaN / +-inf cells during aggregation
//
//   DROP_CELL : cell is left out of its own column's sums only (default)
//   DROP_ROW  : row is left out entirely if any aggregated cell is non-finite
//   FILL_ZERO : cell counts as 0.0 with the row's full weight
// ---------------------------------------------------------------------------
enum class MissingValuePolicy {
    DROP_CELL,
    DROP_ROW,
    FILL_ZERO,
};

inline MissingValuePolicy parse_policy(const std::string& name) {
    if (name == "drop-cell") return MissingValuePolicy::DROP_CELL;
    if (name == "drop-row") return MissingValuePolicy::DROP_ROW;
    if (name == "fill-zero") return MissingValuePolicy::FILL_ZERO;
    throw std::invalid_argument("Unknown missing-value policy: '" + name +
                                "' (expected drop-cell, drop-row or fill-zero)");
}

inline std::string policy_name(MissingValuePolicy policy) {
    switch (policy) {
        case MissingValuePolicy::DROP_CELL: return "drop-cell";
        case MissingValuePolicy::DROP_ROW:  return "drop-row";
        case MissingValuePolicy::FILL_ZERO: return "fill-zero";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// AggregatorConfig
// ---------------------------------------------------------------------------
struct AggregatorConfig {
    double alpha = DEFAULT_ALPHA;
    MissingValuePolicy policy = MissingValuePolicy::DROP_CELL;
};

// ---------------------------------------------------------------------------
// WeightedFeatureVector - one entity's decayed mean as of a cutoff.
// Only columns with at least one finite contribution are present.
// ---------------------------------------------------------------------------
struct WeightedFeatureVector {
    std::string entity_id;
    int cutoff = 0;
    std::vector<std::string> column_names;
    std::vector<double> values;
    int rows_used = 0;
    double total_weight = 0.0;

    bool has_column(const std::string& name) const {
        for (const auto& c : column_names) {
            if (c == name) return true;
        }
        return false;
    }

    std::optional<double> get(const std::string& name) const {
        for (size_t i = 0; i < column_names.size(); ++i) {
            if (column_names[i] == name) return values[i];
        }
        return std::nullopt;
    }
};

// ---------------------------------------------------------------------------
// DecayAggregator - exponentially time-decayed weighted mean per column
//
// For each requested column c:
//     value_c = sum_i(w_i * v_ic) / sum_i(w_i),  w_i = exp(-alpha * age_i)
// over the entity's rows with date < cutoff. The caller's rows are read
// only; ages and weights are kept in call-local buffers.
//
// The means are computed with weights relative to the newest surviving row,
// exp(-alpha * (age_i - min_age)). The ratio is unchanged and the newest row
// weighs 1.0, so histories far older than the cutoff stay exact instead of
// underflowing. total_weight reports the absolute sum_i(w_i).
//
// Returns std::nullopt when no row lies before the cutoff (or none
// survives the missing-value policy). An absent history is never turned
// into a zero vector.
// ---------------------------------------------------------------------------
class DecayAggregator {
public:
    explicit DecayAggregator(const AggregatorConfig& config = {}) : config_(config) {
        if (!std::isfinite(config_.alpha) || config_.alpha <= 0.0) {
            throw std::invalid_argument("Decay rate alpha must be positive and finite, got " +
                                        std::to_string(config_.alpha));
        }
    }

    const AggregatorConfig& config() const { return config_; }

    // Aggregate every row of `history`, which must hold a single entity.
    std::optional<WeightedFeatureVector> aggregate(
        const ObservationTable& history,
        int cutoff,
        const std::vector<std::string>& columns = {}) const {
        return aggregate(history, history.rows(), cutoff, columns);
    }

    // Aggregate `rows` (one entity) laid out according to `table`'s columns.
    // An empty `columns` list means every feature column of the table.
    std::optional<WeightedFeatureVector> aggregate(
        const ObservationTable& table,
        const std::vector<ObservationRow>& rows,
        int cutoff,
        const std::vector<std::string>& columns = {}) const {

        auto indices = resolve_columns(table, columns);
        int64_t cutoff_day = date_utils::to_day_number(cutoff);

        const std::string* entity = nullptr;
        std::vector<const ObservationRow*> history;
        std::vector<double> ages;
        for (const auto& row : rows) {
            if (entity == nullptr) {
                entity = &row.entity_id;
            } else if (row.entity_id != *entity) {
                throw std::invalid_argument("aggregate expects rows of a single entity, got '" +
                                            *entity + "' and '" + row.entity_id + "'");
            }
            if (row.date >= cutoff) continue;

            if (config_.policy == MissingValuePolicy::DROP_ROW && !all_finite(row, indices)) {
                continue;
            }
            double age = static_cast<double>(cutoff_day - date_utils::to_day_number(row.date));
            history.push_back(&row);
            ages.push_back(age);
        }

        if (history.empty()) return std::nullopt;

        double min_age = *std::min_element(ages.begin(), ages.end());

        size_t n_cols = indices.size();
        std::vector<double> weighted_sum(n_cols, 0.0);
        std::vector<double> weight_total(n_cols, 0.0);
        double total_weight = 0.0;
        int rows_used = 0;

        for (size_t r = 0; r < history.size(); ++r) {
            const auto& values = history[r]->values;
            double w = temporal_weight(ages[r] - min_age, config_.alpha);
            bool contributed = false;
            for (size_t c = 0; c < n_cols; ++c) {
                double v = values[indices[c]];
                if (!std::isfinite(v)) {
                    if (config_.policy != MissingValuePolicy::FILL_ZERO) continue;
                    v = 0.0;
                }
                weighted_sum[c] += w * v;
                weight_total[c] += w;
                contributed = true;
            }
            if (contributed) {
                total_weight += temporal_weight(ages[r], config_.alpha);
                ++rows_used;
            }
        }

        if (rows_used == 0) return std::nullopt;

        WeightedFeatureVector out;
        out.entity_id = *entity;
        out.cutoff = cutoff;
        out.rows_used = rows_used;
        out.total_weight = total_weight;
        for (size_t c = 0; c < n_cols; ++c) {
            if (weight_total[c] <= 0.0) continue;
            double mean = weighted_sum[c] / weight_total[c];
            if (!std::isfinite(mean)) continue;
            out.column_names.push_back(table.column_names()[indices[c]]);
            out.values.push_back(mean);
        }

        if (out.column_names.empty()) return std::nullopt;
        return out;
    }

private:
    AggregatorConfig config_;

    static std::vector<size_t> resolve_columns(const ObservationTable& table,
                                               const std::vector<std::string>& columns) {
        std::vector<size_t> indices;
        if (columns.empty()) {
            indices.reserve(table.num_columns());
            for (size_t i = 0; i < table.num_columns(); ++i) {
                if (!table.is_reserved(table.column_names()[i])) indices.push_back(i);
            }
            return indices;
        }
        indices.reserve(columns.size());
        for (const auto& name : columns) {
            if (table.is_reserved(name)) {
                throw std::invalid_argument("Column '" + name + "' is reserved and cannot be aggregated");
            }
            auto idx = table.column_index(name);
            if (!idx) {
                throw std::invalid_argument("Unknown feature column: " + name);
            }
            indices.push_back(*idx);
        }
        return indices;
    }

    static bool all_finite(const ObservationRow& row, const std::vector<size_t>& indices) {
        for (size_t i : indices) {
            if (!std::isfinite(row.values[i])) return false;
        }
        return true;
    }
};
