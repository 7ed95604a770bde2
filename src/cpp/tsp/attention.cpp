#include "attention.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tsp
{

namespace
{

// [bsz, len, H*hd] -> [bsz, H, len, hd]
torch::Tensor splitHeads(const torch::Tensor& x, int64_t num_heads)
{
    const auto bsz = x.size(0);
    const auto len = x.size(1);
    const auto head_dim = x.size(2) / num_heads;
    return x.reshape({bsz, len, num_heads, head_dim}).transpose(1, 2);
}

void checkShapes(const torch::Tensor& query, const torch::Tensor& key,
                 const torch::Tensor& value, int64_t num_heads, const torch::Tensor& mask)
{
    if (!query.defined() || !key.defined() || !value.defined() ||
        query.dim() != 3 || key.dim() != 3 || value.dim() != 3)
        throw std::invalid_argument("multiHeadAttention expects 3D query/key/value tensors");

    if (query.size(0) != key.size(0) || key.size(0) != value.size(0))
    {
        throw std::invalid_argument("multiHeadAttention batch mismatch: query=" +
                                    std::to_string(query.size(0)) + ", key=" +
                                    std::to_string(key.size(0)) + ", value=" +
                                    std::to_string(value.size(0)));
    }
    if (key.size(1) != value.size(1))
        throw std::invalid_argument("multiHeadAttention key/value length mismatch");

    const auto dim_emb = query.size(2);
    if (key.size(2) != dim_emb || value.size(2) != dim_emb)
        throw std::invalid_argument("multiHeadAttention embedding width mismatch");
    if (num_heads <= 0 || dim_emb % num_heads != 0)
    {
        throw std::invalid_argument("Embedding width " + std::to_string(dim_emb) +
                                    " is not divisible by " + std::to_string(num_heads) + " heads");
    }

    if (mask.defined())
    {
        if (mask.dim() != 2 || mask.size(0) != key.size(0) || mask.size(1) != key.size(1))
        {
            throw std::invalid_argument("multiHeadAttention mask must be [bsz, kv_len] = [" +
                                        std::to_string(key.size(0)) + ", " +
                                        std::to_string(key.size(1)) + "]");
        }
    }
}

} // anonymous namespace

AttentionOutput multiHeadAttention(const torch::Tensor& query,
                                   const torch::Tensor& key,
                                   const torch::Tensor& value,
                                   int64_t num_heads,
                                   const torch::Tensor& mask,
                                   std::optional<double> clip_value)
{
    checkShapes(query, key, value, num_heads, mask);

    const auto bsz = query.size(0);
    const auto q_len = query.size(1);
    const auto kv_len = key.size(1);
    const auto dim_emb = query.size(2);

    auto q = splitHeads(query, num_heads);
    auto k = splitHeads(key, num_heads);
    auto v = splitHeads(value, num_heads);

    auto logits = torch::matmul(q, k.transpose(-2, -1)) /
                  std::sqrt(static_cast<double>(q.size(-1)));  // [bsz, H, q_len, kv_len]

    if (clip_value)
        logits = *clip_value * torch::tanh(logits);

    if (mask.defined())
    {
        auto expanded = mask.to(torch::kBool).reshape({bsz, 1, 1, kv_len});
        logits = logits.masked_fill(expanded, kMaskedLogit);
    }

    auto weights = torch::softmax(logits, -1);
    auto output = torch::matmul(weights, v);  // [bsz, H, q_len, hd]
    output = output.transpose(1, 2).contiguous().view({bsz, q_len, dim_emb});

    return {output, weights.mean(1)};
}

} // namespace tsp
