#pragma once

#include "aggregation/aggregator.hpp"
#include "date_utils.hpp"
#include "inference/latent_batch.hpp"
#include "records/observation_table.hpp"

#include <torch/torch.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// aggregate_for_encoder - decayed history laid out in `column_names` order
//
// Columns the aggregate lacks (no finite history) are filled with 0.0 here,
// after aggregation; the weighted means themselves never see a fill value.
// ---------------------------------------------------------------------------
inline std::optional<std::vector<float>> aggregate_for_encoder(
    const ObservationTable& table,
    const std::vector<ObservationRow>& rows,
    int cutoff,
    const AggregatorConfig& config,
    const std::vector<std::string>& column_names) {

    if (column_names.empty()) {
        throw std::invalid_argument("aggregate_for_encoder requires a non-empty column list");
    }
    std::vector<std::string> known;
    for (const auto& c : column_names) {
        if (table.has_column(c) && !table.is_reserved(c)) known.push_back(c);
    }

    DecayAggregator aggregator(config);
    std::optional<WeightedFeatureVector> agg;
    if (!known.empty()) agg = aggregator.aggregate(table, rows, cutoff, known);
    if (!agg) return std::nullopt;

    std::vector<float> out;
    out.reserve(column_names.size());
    for (const auto& c : column_names) {
        auto v = agg->get(c);
        out.push_back(v ? static_cast<float>(*v) : 0.0f);
    }
    return out;
}

// ---------------------------------------------------------------------------
// infer_latent - aggregate one entity's history and run the encoder on it
//
// EncoderType is a torch module holder exposing encode(Tensor). Returns
// std::nullopt (with a warning on stderr) when the entity has no usable
// history before the cutoff; it does not throw for that case so batch
// callers can move on to the next entity.
// ---------------------------------------------------------------------------
template <typename EncoderType>
std::optional<std::vector<float>> infer_latent(
    const ObservationTable& table,
    const std::vector<ObservationRow>& rows,
    int cutoff,
    const AggregatorConfig& config,
    EncoderType& encoder,
    const std::vector<std::string>& column_names) {

    auto features = aggregate_for_encoder(table, rows, cutoff, config, column_names);
    if (!features) {
        std::string who = rows.empty() ? std::string("entity") : "'" + rows.front().entity_id + "'";
        std::cerr << "WARNING: no historical data for " << who << " before "
                  << date_utils::format_date(cutoff) << "\n";
        return std::nullopt;
    }

    int64_t dim = static_cast<int64_t>(features->size());
    auto input = torch::from_blob(features->data(), {1, dim}, torch::kFloat32).clone();

    encoder->eval();
    torch::NoGradGuard no_grad;
    auto latent = encoder->encode(input).contiguous().to(torch::kFloat32);

    std::vector<float> out(latent.data_ptr<float>(), latent.data_ptr<float>() + latent.numel());
    return out;
}

// ---------------------------------------------------------------------------
// extract_latents - infer_latent for every entity in the table, by sorted id
// ---------------------------------------------------------------------------
template <typename EncoderType>
LatentBatch extract_latents(const ObservationTable& table,
                            int cutoff,
                            const AggregatorConfig& config,
                            EncoderType& encoder,
                            const std::vector<std::string>& column_names) {
    LatentBatch batch;
    batch.cutoff = cutoff;
    for (const auto& [id, rows] : table.group_by_entity()) {
        auto latent = infer_latent(table, rows, cutoff, config, encoder, column_names);
        if (!latent) {
            batch.skipped.push_back(id);
            continue;
        }
        batch.entity_ids.push_back(id);
        batch.latents.push_back(std::move(*latent));
    }
    return batch;
}
