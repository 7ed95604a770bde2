#include "decoder.hpp"

#include <stdexcept>
#include <string>

#include "attention.hpp"

namespace tsp
{

namespace
{

torch::nn::LayerNorm makeLayerNorm(int64_t dim)
{
    return torch::nn::LayerNorm(torch::nn::LayerNormOptions({dim}));
}

void checkDecoderInputs(const torch::Tensor& h_t, const torch::Tensor& k_att,
                        const torch::Tensor& v_att, const torch::Tensor& mask, int64_t width)
{
    if (!h_t.defined() || h_t.dim() != 2)
        throw std::invalid_argument("Decoder query must be [rows, dim_emb]");
    if (!k_att.defined() || !v_att.defined() || k_att.dim() != 3 || v_att.dim() != 3 ||
        k_att.sizes() != v_att.sizes())
        throw std::invalid_argument("Decoder keys/values must be matching [rows, nb_nodes+1, width]");
    if (!mask.defined() || mask.dim() != 2)
        throw std::invalid_argument("Decoder mask must be [rows, nb_nodes+1]");
    if (k_att.size(2) != width)
    {
        throw std::invalid_argument("Decoder keys have width " + std::to_string(k_att.size(2)) +
                                    ", expected " + std::to_string(width));
    }

    const auto rows = h_t.size(0);
    if (k_att.size(0) != rows || mask.size(0) != rows)
    {
        throw std::invalid_argument("Decoder batch mismatch: query=" + std::to_string(rows) +
                                    ", keys=" + std::to_string(k_att.size(0)) +
                                    ", mask=" + std::to_string(mask.size(0)));
    }
    if (mask.size(1) != k_att.size(1))
        throw std::invalid_argument("Decoder mask must be [rows, nb_nodes+1]");
}

} // anonymous namespace

// ============================================================================
// DecoderLayer
// ============================================================================

DecoderLayerImpl::DecoderLayerImpl(int64_t dim_emb, int64_t nb_heads)
    : dim_emb_(dim_emb), nb_heads_(nb_heads)
{
    if (nb_heads <= 0 || dim_emb % nb_heads != 0)
    {
        throw std::invalid_argument("DecoderLayer: dim_emb (" + std::to_string(dim_emb) +
                                    ") must be divisible by nb_heads (" + std::to_string(nb_heads) + ")");
    }

    wq_selfatt_ = register_module("Wq_selfatt", torch::nn::Linear(dim_emb, dim_emb));
    wk_selfatt_ = register_module("Wk_selfatt", torch::nn::Linear(dim_emb, dim_emb));
    wv_selfatt_ = register_module("Wv_selfatt", torch::nn::Linear(dim_emb, dim_emb));
    w0_selfatt_ = register_module("W0_selfatt", torch::nn::Linear(dim_emb, dim_emb));
    w0_att_ = register_module("W0_att", torch::nn::Linear(dim_emb, dim_emb));
    wq_att_ = register_module("Wq_att", torch::nn::Linear(dim_emb, dim_emb));
    w1_mlp_ = register_module("W1_MLP", torch::nn::Linear(dim_emb, dim_emb));
    w2_mlp_ = register_module("W2_MLP", torch::nn::Linear(dim_emb, dim_emb));
    norm_selfatt_ = register_module("BN_selfatt", makeLayerNorm(dim_emb));
    norm_att_ = register_module("BN_att", makeLayerNorm(dim_emb));
    norm_mlp_ = register_module("BN_MLP", makeLayerNorm(dim_emb));
}

torch::Tensor DecoderLayerImpl::forward(const torch::Tensor& h_t, const torch::Tensor& k_att,
                                        const torch::Tensor& v_att, const torch::Tensor& mask,
                                        SelfAttentionCache& cache)
{
    checkDecoderInputs(h_t, k_att, v_att, mask, dim_emb_);
    const auto rows = h_t.size(0);
    auto h = h_t.reshape({rows, 1, dim_emb_});

    // Self-attention of the current step against the partial-tour history
    auto q_sa = wq_selfatt_->forward(h);
    cache.append(wk_selfatt_->forward(h), wv_selfatt_->forward(h));
    h = h + w0_selfatt_->forward(multiHeadAttention(q_sa, cache.keys(), cache.values(), nb_heads_).output);
    h = norm_selfatt_->forward(h);

    // Cross-attention onto the unvisited encoder nodes
    auto q_a = wq_att_->forward(h);
    h = h + w0_att_->forward(multiHeadAttention(q_a, k_att, v_att, nb_heads_, mask).output);
    h = norm_att_->forward(h);

    h = h + w2_mlp_->forward(torch::relu(w1_mlp_->forward(h)));
    h = norm_mlp_->forward(h);

    return h.reshape({rows, dim_emb_});
}

// ============================================================================
// Decoder
// ============================================================================

DecoderImpl::DecoderImpl(int64_t dim_emb, int64_t nb_heads, int64_t nb_layers,
                         std::optional<int64_t> segm_len, double final_clip_value)
    : dim_emb_(dim_emb), nb_heads_(nb_heads), nb_layers_(nb_layers)
    , segm_len_(segm_len), final_clip_value_(final_clip_value)
{
    if (nb_layers < 1)
        throw std::invalid_argument("Decoder needs at least one layer");
    if (segm_len && *segm_len <= 0)
        throw std::invalid_argument("segm_len must be positive when set");

    for (int64_t l = 0; l < nb_layers - 1; l++)
        layers_.push_back(register_module("decoder_layer_" + std::to_string(l), DecoderLayer(dim_emb, nb_heads)));
    wq_final_ = register_module("Wq_final", torch::nn::Linear(dim_emb, dim_emb));
}

DecoderCache DecoderImpl::makeCache() const
{
    return DecoderCache(layers_.size(), segm_len_);
}

torch::Tensor DecoderImpl::forward(const torch::Tensor& h_t, const torch::Tensor& k_att,
                                   const torch::Tensor& v_att, const torch::Tensor& mask,
                                   DecoderCache& cache)
{
    checkDecoderInputs(h_t, k_att, v_att, mask, nb_layers_ * dim_emb_);
    if (cache.numLayers() != layers_.size())
    {
        throw std::invalid_argument("Decoder cache has " + std::to_string(cache.numLayers()) +
                                    " layers, decoder has " + std::to_string(layers_.size()));
    }

    auto h = h_t;
    for (int64_t l = 0; l < nb_layers_ - 1; l++)
    {
        auto k_l = k_att.narrow(2, l * dim_emb_, dim_emb_).contiguous();
        auto v_l = v_att.narrow(2, l * dim_emb_, dim_emb_).contiguous();
        h = layers_[l]->forward(h, k_l, v_l, mask, cache.layer(static_cast<size_t>(l)));
    }

    // Final single-head pointer layer: its attention weights are the output distribution.
    const auto last = nb_layers_ - 1;
    auto k_last = k_att.narrow(2, last * dim_emb_, dim_emb_).contiguous();
    auto v_last = v_att.narrow(2, last * dim_emb_, dim_emb_).contiguous();
    auto q_final = wq_final_->forward(h).reshape({h.size(0), 1, dim_emb_});
    auto attn = multiHeadAttention(q_final, k_last, v_last, 1, mask, final_clip_value_);
    return attn.weights.squeeze(1);
}

} // namespace tsp
