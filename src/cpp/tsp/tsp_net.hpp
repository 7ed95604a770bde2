#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <torch/torch.h>

#include "config.hpp"
#include "decoder.hpp"
#include "embedding.hpp"
#include "encoder.hpp"
#include "policy.hpp"

namespace tsp
{

enum class DecodeMode
{
    Greedy,
    BeamSearch,
    Both,
};

/// Parse "greedy", "beamsearch" or "both".
DecodeMode parseDecodeMode(const std::string& name);
const char* decodeModeName(DecodeMode mode);

struct DecodeOptions
{
    DecodeMode mode{DecodeMode::Greedy};
    int64_t beam_width{1};
    bool deterministic{true};  // greedy: argmax when true, categorical sampling otherwise
};

/// Encoder-decoder pointer network constructing TSP tours.
///
/// Owns the node embedding, the encoder, the learned start placeholder, the decoder stack
/// and the cross-attention key/value projections. Decoding state never lives on the
/// module: every decode run gets its own session and cache, so one instance can serve
/// independent runs one after another.
class TSPNetImpl : public torch::nn::Module
{
public:
    /// Validates the config (std::invalid_argument on failure).
    explicit TSPNetImpl(const TspNetConfig& config);

    /// Embed and encode coords [bsz, N, dim_input_nodes], append the start token and
    /// project the cross-attention keys/values for every decoder layer.
    EncodedInstance encode(const torch::Tensor& coords);

    /// Full decode in the requested mode(s). Each mode runs on its own fresh cache.
    DecodeResult forward(const torch::Tensor& coords, const DecodeOptions& options = {});

    GreedySession greedySession(const EncodedInstance& context, bool deterministic = true);
    BeamSearchSession beamSearchSession(const EncodedInstance& context, int64_t beam_width);

    const TspNetConfig& config() const { return config_; }
    const torch::Tensor& positionalEncoding() const { return pe_; }
    Decoder decoder() const { return decoder_; }

private:
    TspNetConfig config_;

    std::shared_ptr<NodeEmbeddingImpl> input_emb_;
    Encoder encoder_{nullptr};
    torch::Tensor start_placeholder_;
    Decoder decoder_{nullptr};
    torch::nn::Linear wk_att_decoder_{nullptr};
    torch::nn::Linear wv_att_decoder_{nullptr};
    torch::Tensor pe_;
};
TORCH_MODULE(TSPNet);

} // namespace tsp
