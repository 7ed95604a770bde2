#include "kv_cache.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace tsp
{

namespace
{

torch::Tensor asStepEntry(const torch::Tensor& x)
{
    if (x.dim() == 2)
        return x.unsqueeze(1);
    if (x.dim() == 3 && x.size(1) == 1)
        return x;
    throw std::invalid_argument("Cache entries must be [rows, dim_emb] or [rows, 1, dim_emb]");
}

// [bsz * src_width, len, dim] -> [bsz * width, len, dim], picking beam_idx[b] per batch row.
torch::Tensor gatherBeams(const torch::Tensor& cached, const torch::Tensor& beam_idx)
{
    const auto bsz = beam_idx.size(0);
    const auto width = beam_idx.size(1);
    const auto src_width = cached.size(0) / bsz;
    const auto len = cached.size(1);
    const auto dim = cached.size(2);

    auto per_row = cached.reshape({bsz, src_width, len, dim});
    auto batch = torch::arange(bsz, beam_idx.options()).unsqueeze(1);
    // Advanced indexing copies, so the result never aliases the source history.
    return per_row.index({batch, beam_idx}).reshape({bsz * width, len, dim});
}

} // anonymous namespace

// ============================================================================
// SelfAttentionCache
// ============================================================================

SelfAttentionCache::SelfAttentionCache(std::optional<int64_t> window)
    : window_(window)
{
    if (window_ && *window_ <= 0)
        throw std::invalid_argument("Self-attention window must be positive");
}

void SelfAttentionCache::reset()
{
    keys_ = torch::Tensor();
    values_ = torch::Tensor();
}

void SelfAttentionCache::append(const torch::Tensor& key, const torch::Tensor& value)
{
    auto k = asStepEntry(key);
    auto v = asStepEntry(value);
    if (k.sizes() != v.sizes())
        throw std::invalid_argument("Cache key/value shapes differ");

    if (empty())
    {
        keys_ = k;
        values_ = v;
    }
    else
    {
        if (k.size(0) != keys_.size(0))
        {
            throw std::invalid_argument("Cache holds " + std::to_string(keys_.size(0)) +
                                        " rows but step provides " + std::to_string(k.size(0)) +
                                        " (missing reorder/repeat?)");
        }
        keys_ = torch::cat({keys_, k}, 1);
        values_ = torch::cat({values_, v}, 1);
    }

    if (window_ && keys_.size(1) > *window_)
    {
        keys_ = keys_.narrow(1, keys_.size(1) - *window_, *window_);
        values_ = values_.narrow(1, values_.size(1) - *window_, *window_);
    }
}

int64_t SelfAttentionCache::expectedLength(int64_t step) const
{
    return window_ ? std::min(*window_, step + 1) : step + 1;
}

void SelfAttentionCache::reorder(int64_t step, const torch::Tensor& beam_idx)
{
    if (empty())
        throw std::logic_error("Cannot reorder an empty self-attention cache");
    if (beam_idx.dim() != 2)
        throw std::invalid_argument("Beam indices must be [bsz, width]");
    if (length() != expectedLength(step))
    {
        throw std::logic_error("Self-attention cache holds " + std::to_string(length()) +
                               " entries, expected " + std::to_string(expectedLength(step)) +
                               " after step " + std::to_string(step));
    }
    if (keys_.size(0) % beam_idx.size(0) != 0)
    {
        throw std::invalid_argument("Cache rows (" + std::to_string(keys_.size(0)) +
                                    ") are not a multiple of the batch size (" +
                                    std::to_string(beam_idx.size(0)) + ")");
    }

    auto idx = beam_idx.to(keys_.device(), torch::kLong);
    keys_ = gatherBeams(keys_, idx);
    values_ = gatherBeams(values_, idx);
}

void SelfAttentionCache::repeat(int64_t width)
{
    if (empty())
        throw std::logic_error("Cannot repeat an empty self-attention cache");
    if (width <= 0)
        throw std::invalid_argument("Repeat width must be positive");

    keys_ = keys_.repeat_interleave(width, 0);
    values_ = values_.repeat_interleave(width, 0);
}

// ============================================================================
// DecoderCache
// ============================================================================

DecoderCache::DecoderCache(size_t num_layers, std::optional<int64_t> window)
    : layers_(num_layers, SelfAttentionCache(window))
{
}

void DecoderCache::reset()
{
    for (auto& cache : layers_)
        cache.reset();
}

void DecoderCache::reorder(int64_t step, const torch::Tensor& beam_idx)
{
    for (auto& cache : layers_)
        cache.reorder(step, beam_idx);
}

void DecoderCache::repeat(int64_t width)
{
    for (auto& cache : layers_)
        cache.repeat(width);
}

int64_t DecoderCache::length() const
{
    return layers_.empty() ? 0 : layers_.front().length();
}

int64_t DecoderCache::rows() const
{
    return layers_.empty() ? 0 : layers_.front().rows();
}

} // namespace tsp
