#include "encoder.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace tsp
{

FeatureNormImpl::FeatureNormImpl(int64_t dim, bool batchnorm)
{
    if (batchnorm)
        batch_norm_ = register_module("norm", torch::nn::BatchNorm1d(dim));
    else
        layer_norm_ = register_module("norm", torch::nn::LayerNorm(torch::nn::LayerNormOptions({dim})));
}

torch::Tensor FeatureNormImpl::forward(const torch::Tensor& h)
{
    if (batch_norm_.is_empty())
        return layer_norm_->forward(h);

    // BatchNorm1d wants channels on axis 1: [bsz, dim, len]
    return batch_norm_->forward(h.permute({0, 2, 1}).contiguous()).permute({0, 2, 1}).contiguous();
}

EncoderImpl::EncoderImpl(int64_t nb_layers, int64_t dim_emb, int64_t nb_heads, int64_t dim_ff,
                         bool batchnorm)
    : nb_layers_(nb_layers)
{
    if (nb_heads <= 0 || dim_emb % nb_heads != 0)
    {
        throw std::invalid_argument("Encoder: dim_emb (" + std::to_string(dim_emb) +
                                    ") must be divisible by nb_heads (" + std::to_string(nb_heads) + ")");
    }

    for (int64_t i = 0; i < nb_layers; i++)
    {
        const auto idx = std::to_string(i);
        mha_layers_.push_back(register_module(
            "MHA_" + idx, torch::nn::MultiheadAttention(torch::nn::MultiheadAttentionOptions(dim_emb, nb_heads))));
        linear1_layers_.push_back(register_module("linear1_" + idx, torch::nn::Linear(dim_emb, dim_ff)));
        linear2_layers_.push_back(register_module("linear2_" + idx, torch::nn::Linear(dim_ff, dim_emb)));
        norm1_layers_.push_back(register_module("norm1_" + idx, FeatureNorm(dim_emb, batchnorm)));
        norm2_layers_.push_back(register_module("norm2_" + idx, FeatureNorm(dim_emb, batchnorm)));
    }
}

EncoderOutput EncoderImpl::forward(const torch::Tensor& h_in)
{
    if (h_in.dim() != 3)
        throw std::invalid_argument("Encoder input must be [bsz, nb_nodes+1, dim_emb]");

    auto h = h_in;
    torch::Tensor score;
    for (int64_t i = 0; i < nb_layers_; i++)
    {
        // MultiheadAttention is sequence-first: [len, bsz, dim]
        auto h_seq = h.transpose(0, 1);
        torch::Tensor attended;
        std::tie(attended, score) = mha_layers_[i]->forward(h_seq, h_seq, h_seq);
        h = norm1_layers_[i]->forward(h + attended.transpose(0, 1));

        auto ff = linear2_layers_[i]->forward(torch::relu(linear1_layers_[i]->forward(h)));
        h = norm2_layers_[i]->forward(h + ff);
    }
    return {h, score};
}

} // namespace tsp
