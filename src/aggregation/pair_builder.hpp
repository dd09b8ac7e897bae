#pragma once

#include "aggregation/aggregator.hpp"
#include "records/observation_table.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// TrainingPair - (history aggregate, outcome on cutoff) for one entity.
// Both vectors follow TrainingSet::column_names.
// ---------------------------------------------------------------------------
struct TrainingPair {
    std::string entity_id;
    std::vector<double> features;
    std::vector<double> target;
};

// ---------------------------------------------------------------------------
// TrainingSet - output of build_training_set() plus skip diagnostics
// ---------------------------------------------------------------------------
struct TrainingSet {
    int cutoff = 0;
    std::vector<std::string> column_names;
    std::vector<TrainingPair> pairs;

    int eligible_entities = 0;
    int excluded_no_history = 0;      // label on cutoff but nothing before it
    int excluded_no_label = 0;        // history but no row on the cutoff
    int skipped_no_history = 0;       // eligible, aggregate came back empty
    int skipped_column_mismatch = 0;  // aggregate and label share no column

    size_t size() const { return pairs.size(); }
    bool empty() const { return pairs.empty(); }
    size_t dimension() const { return column_names.size(); }

    std::vector<std::string> entity_ids() const {
        std::vector<std::string> ids;
        ids.reserve(pairs.size());
        for (const auto& p : pairs) ids.push_back(p.entity_id);
        return ids;
    }
};

// ---------------------------------------------------------------------------
// PairBuilderConfig
// ---------------------------------------------------------------------------
struct PairBuilderConfig {
    AggregatorConfig aggregator;
    int num_threads = 1;
};

namespace pair_builder_detail {

struct EntityResult {
    std::optional<WeightedFeatureVector> aggregate;
    std::vector<bool> usable;  // per table column: in aggregate and finite in label
    bool any_usable = false;
};

inline EntityResult process_entity(const DecayAggregator& aggregator,
                                   const ObservationTable& table,
                                   const std::vector<ObservationRow>& history,
                                   const ObservationRow& label,
                                   int cutoff) {
    EntityResult res;
    res.aggregate = aggregator.aggregate(table, history, cutoff);
    if (!res.aggregate) return res;

    res.usable.assign(table.num_columns(), false);
    for (const auto& name : res.aggregate->column_names) {
        size_t idx = *table.column_index(name);
        if (std::isfinite(label.values[idx])) {
            res.usable[idx] = true;
            res.any_usable = true;
        }
    }
    return res;
}

}  // namespace pair_builder_detail

// ---------------------------------------------------------------------------
// build_training_set - pair each entity's decayed history with its outcome
//
//   1. history = rows with date < cutoff, ground truth = rows with date == cutoff
//   2. eligible = ids present in both
//   3. aggregate each eligible entity (empty aggregate -> skipped_no_history)
//   4. per entity: aggregated columns that are finite in its first cutoff row
//      (empty -> skipped_column_mismatch)
//   5. final columns = intersection over surviving entities, table order
//
// Entities are visited in ascending id order. With num_threads > 1 the
// per-entity work is split across threads writing disjoint result slots,
// so the output matches the single-threaded run exactly.
// ---------------------------------------------------------------------------
inline TrainingSet build_training_set(const ObservationTable& table,
                                      int cutoff,
                                      const PairBuilderConfig& config = {}) {
    if (config.num_threads < 1) {
        throw std::invalid_argument("num_threads must be >= 1, got " +
                                    std::to_string(config.num_threads));
    }
    DecayAggregator aggregator(config.aggregator);

    TrainingSet set;
    set.cutoff = cutoff;

    // Step 1-2: eligibility.
    std::set<std::string> history_ids;
    std::set<std::string> label_ids;
    for (const auto& row : table.rows()) {
        if (row.date < cutoff) history_ids.insert(row.entity_id);
        else if (row.date == cutoff) label_ids.insert(row.entity_id);
    }
    std::vector<std::string> eligible;
    std::set_intersection(history_ids.begin(), history_ids.end(),
                          label_ids.begin(), label_ids.end(),
                          std::back_inserter(eligible));
    set.eligible_entities = static_cast<int>(eligible.size());
    set.excluded_no_history = static_cast<int>(label_ids.size() - eligible.size());
    set.excluded_no_label = static_cast<int>(history_ids.size() - eligible.size());
    if (eligible.empty()) return set;

    // Step 3: restrict to eligible entities and split per entity.
    std::set<std::string> eligible_set(eligible.begin(), eligible.end());
    std::map<std::string, std::vector<ObservationRow>> histories;
    std::map<std::string, ObservationRow> labels;
    for (const auto& row : table.rows()) {
        if (eligible_set.count(row.entity_id) == 0) continue;
        if (row.date < cutoff) {
            histories[row.entity_id].push_back(row);
        } else if (row.date == cutoff) {
            labels.emplace(row.entity_id, row);  // first cutoff row wins
        }
    }

    // Step 4: aggregate.
    size_t n = eligible.size();
    std::vector<pair_builder_detail::EntityResult> results(n);
    auto work = [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            const auto& id = eligible[i];
            results[i] = pair_builder_detail::process_entity(
                aggregator, table, histories.at(id), labels.at(id), cutoff);
        }
    };

    size_t n_threads = std::min(static_cast<size_t>(config.num_threads), n);
    if (n_threads <= 1) {
        work(0, n);
    } else {
        std::vector<std::thread> workers;
        std::vector<std::exception_ptr> errors(n_threads);
        workers.reserve(n_threads);
        size_t chunk = (n + n_threads - 1) / n_threads;
        for (size_t t = 0; t < n_threads; ++t) {
            size_t begin = t * chunk;
            size_t end = std::min(n, begin + chunk);
            if (begin >= end) break;
            workers.emplace_back([&work, &errors, t, begin, end]() {
                try {
                    work(begin, end);
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            });
        }
        for (auto& w : workers) w.join();
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }
    }

    // Step 5: reconcile column sets.
    std::vector<bool> common(table.num_columns(), true);
    std::vector<size_t> survivors;
    for (size_t i = 0; i < n; ++i) {
        const auto& res = results[i];
        if (!res.aggregate) {
            ++set.skipped_no_history;
            continue;
        }
        if (!res.any_usable) {
            ++set.skipped_column_mismatch;
            continue;
        }
        for (size_t c = 0; c < common.size(); ++c) {
            common[c] = common[c] && res.usable[c];
        }
        survivors.push_back(i);
    }

    std::vector<size_t> final_indices;
    for (size_t c = 0; c < common.size(); ++c) {
        if (common[c]) final_indices.push_back(c);
    }
    if (final_indices.empty()) {
        set.skipped_column_mismatch += static_cast<int>(survivors.size());
        return set;
    }
    for (size_t c : final_indices) set.column_names.push_back(table.column_names()[c]);

    // Step 6: emit pairs in one column order.
    set.pairs.reserve(survivors.size());
    for (size_t i : survivors) {
        const auto& id = eligible[i];
        const auto& agg = *results[i].aggregate;
        const auto& label = labels.at(id);

        TrainingPair pair;
        pair.entity_id = id;
        pair.features.reserve(final_indices.size());
        pair.target.reserve(final_indices.size());
        for (size_t c : final_indices) {
            pair.features.push_back(*agg.get(table.column_names()[c]));
            pair.target.push_back(label.values[c]);
        }
        set.pairs.push_back(std::move(pair));
    }
    return set;
}
