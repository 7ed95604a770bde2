#pragma once

#include <cstdint>
#include <optional>

#include <torch/torch.h>

namespace tsp
{

/// Logit assigned to masked positions before the softmax.
/// Finite on purpose: -inf would turn fully masked rows and their gradients into NaN.
constexpr double kMaskedLogit = -1e9;

struct AttentionOutput
{
    torch::Tensor output;   // [bsz, q_len, dim_emb]
    torch::Tensor weights;  // [bsz, q_len, kv_len], averaged over heads
};

/// Scaled dot-product multi-head attention with explicit Q/K/V.
///
/// query: [bsz, q_len, dim_emb], key/value: [bsz, kv_len, dim_emb],
/// mask: optional bool [bsz, kv_len], true marks a position that may not be attended.
/// When clip_value is set, logits are squashed to clip * tanh(logits) before masking.
/// Heads split the embedding into contiguous blocks of dim_emb / num_heads.
AttentionOutput multiHeadAttention(const torch::Tensor& query,
                                   const torch::Tensor& key,
                                   const torch::Tensor& value,
                                   int64_t num_heads,
                                   const torch::Tensor& mask = {},
                                   std::optional<double> clip_value = std::nullopt);

} // namespace tsp
