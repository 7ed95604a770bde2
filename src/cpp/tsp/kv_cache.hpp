#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <torch/torch.h>

namespace tsp
{

/// Self-attention key/value history of one decoder layer for one decoding run.
///
/// Holds keys and values [rows, len, dim_emb] where rows = bsz * current beam width.
/// After step t (0-indexed) len == min(t + 1, window), or t + 1 without a window.
/// State machine: empty -> warm (append) -> empty (reset).
class SelfAttentionCache
{
public:
    explicit SelfAttentionCache(std::optional<int64_t> window = std::nullopt);

    /// Drop all entries. Idempotent.
    void reset();

    /// Append one key/value per row ([rows, dim_emb] or [rows, 1, dim_emb]),
    /// then keep only the most recent `window` entries.
    void append(const torch::Tensor& key, const torch::Tensor& value);

    /// Rebuild the cache so beam i of batch row b holds the history of source beam
    /// beam_idx[b][i]. beam_idx: int64 [bsz, width], repeats allowed.
    /// `step` is the step whose key/value was appended last; it must agree with length().
    void reorder(int64_t step, const torch::Tensor& beam_idx);

    /// Tile every row `width` times contiguously: rows -> rows * width.
    void repeat(int64_t width);

    bool empty() const { return !keys_.defined(); }
    int64_t length() const { return empty() ? 0 : keys_.size(1); }
    int64_t rows() const { return empty() ? 0 : keys_.size(0); }

    /// Cache length expected right after decoding step `step`.
    int64_t expectedLength(int64_t step) const;

    std::optional<int64_t> window() const { return window_; }
    const torch::Tensor& keys() const { return keys_; }
    const torch::Tensor& values() const { return values_; }

private:
    std::optional<int64_t> window_;
    torch::Tensor keys_;
    torch::Tensor values_;
};

/// One SelfAttentionCache per intermediate decoder layer.
/// Created per decoding run; never shared between concurrent runs.
class DecoderCache
{
public:
    DecoderCache(size_t num_layers, std::optional<int64_t> window);

    void reset();
    void reorder(int64_t step, const torch::Tensor& beam_idx);
    void repeat(int64_t width);

    size_t numLayers() const { return layers_.size(); }
    SelfAttentionCache& layer(size_t l) { return layers_.at(l); }
    const SelfAttentionCache& layer(size_t l) const { return layers_.at(l); }

    /// Length shared by all layers (0 when there are no intermediate layers).
    int64_t length() const;
    int64_t rows() const;

private:
    std::vector<SelfAttentionCache> layers_;
};

} // namespace tsp
