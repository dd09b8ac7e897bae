#pragma once

#include "aggregation/pair_builder.hpp"  // TrainingSet
#include "model/autoencoder.hpp"

#include <torch/torch.h>

#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// TrainConfig / TrainResult
// ---------------------------------------------------------------------------
struct TrainConfig {
    int epochs = 200;
    float learning_rate = 1e-3f;
    std::vector<int> encoding_dims = {128, 64, 32};
    uint64_t seed = 42;
};

struct TrainResult {
    float initial_loss = 0.0f;
    float final_loss = 0.0f;
    std::vector<float> loss_history;  // one entry per epoch
};

// ---------------------------------------------------------------------------
// training_set_to_tensors - (features, targets) as float tensors of shape (N, D)
// ---------------------------------------------------------------------------
inline std::pair<torch::Tensor, torch::Tensor> training_set_to_tensors(const TrainingSet& set) {
    int64_t n = static_cast<int64_t>(set.pairs.size());
    int64_t d = static_cast<int64_t>(set.column_names.size());
    auto x = torch::zeros({n, d});
    auto y = torch::zeros({n, d});
    auto x_acc = x.accessor<float, 2>();
    auto y_acc = y.accessor<float, 2>();
    for (int64_t i = 0; i < n; ++i) {
        const auto& pair = set.pairs[i];
        if (static_cast<int64_t>(pair.features.size()) != d ||
            static_cast<int64_t>(pair.target.size()) != d) {
            throw std::invalid_argument("Training pair for '" + pair.entity_id +
                                        "' does not match the set's column count");
        }
        for (int64_t j = 0; j < d; ++j) {
            x_acc[i][j] = static_cast<float>(pair.features[j]);
            y_acc[i][j] = static_cast<float>(pair.target[j]);
        }
    }
    return {x, y};
}

// ---------------------------------------------------------------------------
// train_autoencoder - full-batch Adam on MSE(model(history), outcome)
//
// The decoder learns to map an entity's decayed history to its next
// observation, so the latent code summarizes predictive form.
// Deterministic: seeds torch with config.seed.
// ---------------------------------------------------------------------------
inline TrainResult train_autoencoder(AggregationAutoencoder& model,
                                     const TrainingSet& set,
                                     const TrainConfig& config = {}) {
    if (set.empty()) {
        throw std::invalid_argument("train_autoencoder requires a non-empty training set");
    }
    if (static_cast<int>(set.dimension()) != model->input_dim()) {
        throw std::invalid_argument("Training set has " + std::to_string(set.dimension()) +
                                    " columns but the model expects " +
                                    std::to_string(model->input_dim()));
    }
    if (config.epochs <= 0) {
        throw std::invalid_argument("epochs must be positive, got " + std::to_string(config.epochs));
    }

    torch::manual_seed(config.seed);

    auto [input_tensor, target_tensor] = training_set_to_tensors(set);

    torch::optim::Adam optimizer(model->parameters(),
                                 torch::optim::AdamOptions(config.learning_rate));

    TrainResult result;
    result.loss_history.reserve(config.epochs);
    model->train();

    for (int epoch = 0; epoch < config.epochs; ++epoch) {
        optimizer.zero_grad();

        auto output = model->forward(input_tensor);
        auto loss = torch::mse_loss(output, target_tensor);

        loss.backward();
        optimizer.step();

        float loss_val = loss.item<float>();
        if (epoch == 0) result.initial_loss = loss_val;
        result.final_loss = loss_val;
        result.loss_history.push_back(loss_val);
    }

    model->eval();
    return result;
}

// ---------------------------------------------------------------------------
// make_and_train_autoencoder - size a fresh model to the set and train it
// ---------------------------------------------------------------------------
inline std::pair<AggregationAutoencoder, TrainResult> make_and_train_autoencoder(
    const TrainingSet& set,
    const TrainConfig& config = {}) {
    if (set.empty()) {
        throw std::invalid_argument("train_autoencoder requires a non-empty training set");
    }
    torch::manual_seed(config.seed);
    AggregationAutoencoder model(static_cast<int>(set.dimension()), config.encoding_dims);
    auto result = train_autoencoder(model, set, config);
    return {model, result};
}
