#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <torch/torch.h>

#include "kv_cache.hpp"

namespace tsp
{

/// One autoregressive decoder layer: self-attention over the partial tour (through an
/// external SelfAttentionCache), cross-attention onto the encoder context, then an MLP.
/// Every sublayer is residual + LayerNorm.
class DecoderLayerImpl : public torch::nn::Module
{
public:
    DecoderLayerImpl(int64_t dim_emb, int64_t nb_heads);

    /// h_t:   [rows, dim_emb] current query (rows = bsz * beam width)
    /// k_att: [rows, nb_nodes+1, dim_emb] cross-attention keys for this layer
    /// v_att: [rows, nb_nodes+1, dim_emb] cross-attention values for this layer
    /// mask:  bool [rows, nb_nodes+1], true for visited nodes
    /// Appends this step's key/value to `cache`. Returns [rows, dim_emb].
    torch::Tensor forward(const torch::Tensor& h_t, const torch::Tensor& k_att,
                          const torch::Tensor& v_att, const torch::Tensor& mask,
                          SelfAttentionCache& cache);

private:
    int64_t dim_emb_;
    int64_t nb_heads_;

    torch::nn::Linear wq_selfatt_{nullptr};
    torch::nn::Linear wk_selfatt_{nullptr};
    torch::nn::Linear wv_selfatt_{nullptr};
    torch::nn::Linear w0_selfatt_{nullptr};
    torch::nn::Linear wq_att_{nullptr};
    torch::nn::Linear w0_att_{nullptr};
    torch::nn::Linear w1_mlp_{nullptr};
    torch::nn::Linear w2_mlp_{nullptr};
    torch::nn::LayerNorm norm_selfatt_{nullptr};
    torch::nn::LayerNorm norm_att_{nullptr};
    torch::nn::LayerNorm norm_mlp_{nullptr};
};
TORCH_MODULE(DecoderLayer);

/// nb_layers - 1 multi-head DecoderLayers followed by a single-head pointer layer whose
/// attention weights are the next-node distribution.
///
/// k_att / v_att hold one dim_emb block per layer: [rows, nb_nodes+1, nb_layers * dim_emb];
/// layer l reads block l.
class DecoderImpl : public torch::nn::Module
{
public:
    DecoderImpl(int64_t dim_emb, int64_t nb_heads, int64_t nb_layers,
                std::optional<int64_t> segm_len = std::nullopt, double final_clip_value = 10.0);

    /// Returns next-node probabilities [rows, nb_nodes+1]; visited nodes get 0.
    torch::Tensor forward(const torch::Tensor& h_t, const torch::Tensor& k_att,
                          const torch::Tensor& v_att, const torch::Tensor& mask,
                          DecoderCache& cache);

    /// Fresh, empty cache sized for this decoder.
    DecoderCache makeCache() const;

    int64_t numLayers() const { return nb_layers_; }
    int64_t dimEmb() const { return dim_emb_; }

private:
    int64_t dim_emb_;
    int64_t nb_heads_;
    int64_t nb_layers_;
    std::optional<int64_t> segm_len_;
    double final_clip_value_;

    std::vector<DecoderLayer> layers_;
    torch::nn::Linear wq_final_{nullptr};
};
TORCH_MODULE(Decoder);

} // namespace tsp
