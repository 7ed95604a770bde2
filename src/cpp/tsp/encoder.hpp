#pragma once

#include <cstdint>
#include <vector>

#include <torch/torch.h>

namespace tsp
{

/// Normalization over the feature axis of [bsz, len, dim] tensors.
/// Batch-style normalizes each feature over (bsz, len); layer-style each vector over dim.
class FeatureNormImpl : public torch::nn::Module
{
public:
    FeatureNormImpl(int64_t dim, bool batchnorm);

    torch::Tensor forward(const torch::Tensor& h);

    bool isBatchNorm() const { return !batch_norm_.is_empty(); }

private:
    torch::nn::BatchNorm1d batch_norm_{nullptr};
    torch::nn::LayerNorm layer_norm_{nullptr};
};
TORCH_MODULE(FeatureNorm);

struct EncoderOutput
{
    torch::Tensor embeddings;  // [bsz, nb_nodes+1, dim_emb]
    torch::Tensor attention;   // [bsz, nb_nodes+1, nb_nodes+1], last layer, diagnostic only
};

/// Stack of self-attention + feed-forward blocks (post-norm residuals, no masking).
class EncoderImpl : public torch::nn::Module
{
public:
    EncoderImpl(int64_t nb_layers, int64_t dim_emb, int64_t nb_heads, int64_t dim_ff, bool batchnorm);

    EncoderOutput forward(const torch::Tensor& h);

    int64_t numLayers() const { return nb_layers_; }

private:
    int64_t nb_layers_;
    std::vector<torch::nn::MultiheadAttention> mha_layers_;
    std::vector<torch::nn::Linear> linear1_layers_;
    std::vector<torch::nn::Linear> linear2_layers_;
    std::vector<FeatureNorm> norm1_layers_;
    std::vector<FeatureNorm> norm2_layers_;
};
TORCH_MODULE(Encoder);

} // namespace tsp
