#pragma once

#include <torch/torch.h>

#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AggregationAutoencoderImpl - feed-forward compressor for aggregated features
//
// Architecture (encoding_dims = {d0, d1, d2}):
//   encoder: Linear input_dim -> d0, ReLU, Linear d0 -> d1, ReLU, Linear d1 -> d2, ReLU
//   decoder: Linear d2 -> d1, ReLU, Linear d1 -> d0, ReLU, Linear d0 -> input_dim
//
// encode() yields the (B, d2) latent vector; forward() reconstructs (B, input_dim).
// ---------------------------------------------------------------------------
struct AggregationAutoencoderImpl : torch::nn::Module {
    explicit AggregationAutoencoderImpl(int input_dim,
                                        std::vector<int> encoding_dims = {128, 64, 32})
        : input_dim_(input_dim), encoding_dims_(validate(input_dim, encoding_dims))
    {
        encoder = register_module("encoder", torch::nn::Sequential(
            torch::nn::Linear(input_dim, encoding_dims_[0]), torch::nn::ReLU(),
            torch::nn::Linear(encoding_dims_[0], encoding_dims_[1]), torch::nn::ReLU(),
            torch::nn::Linear(encoding_dims_[1], encoding_dims_[2]), torch::nn::ReLU()));
        decoder = register_module("decoder", torch::nn::Sequential(
            torch::nn::Linear(encoding_dims_[2], encoding_dims_[1]), torch::nn::ReLU(),
            torch::nn::Linear(encoding_dims_[1], encoding_dims_[0]), torch::nn::ReLU(),
            torch::nn::Linear(encoding_dims_[0], input_dim)));
    }

    torch::Tensor encode(torch::Tensor x) {
        return encoder->forward(x);
    }

    torch::Tensor decode(torch::Tensor z) {
        return decoder->forward(z);
    }

    torch::Tensor forward(torch::Tensor x) {
        return decode(encode(x));
    }

    int input_dim() const { return input_dim_; }
    int latent_dim() const { return encoding_dims_[2]; }
    const std::vector<int>& encoding_dims() const { return encoding_dims_; }

    torch::nn::Sequential encoder{nullptr}, decoder{nullptr};

private:
    int input_dim_;
    std::vector<int> encoding_dims_;

    static std::vector<int> validate(int input_dim, const std::vector<int>& dims) {
        if (input_dim <= 0) {
            throw std::invalid_argument("Autoencoder input_dim must be positive, got " +
                                        std::to_string(input_dim));
        }
        if (dims.size() != 3) {
            throw std::invalid_argument("Autoencoder needs exactly 3 encoding dims, got " +
                                        std::to_string(dims.size()));
        }
        for (int d : dims) {
            if (d <= 0) {
                throw std::invalid_argument("Autoencoder encoding dims must be positive");
            }
        }
        return dims;
    }
};

TORCH_MODULE(AggregationAutoencoder);
