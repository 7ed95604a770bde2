#include "tsp_net.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

#include "positional_encoding.hpp"

namespace tsp
{

DecodeMode parseDecodeMode(const std::string& name)
{
    if (name == "greedy")
        return DecodeMode::Greedy;
    if (name == "beamsearch")
        return DecodeMode::BeamSearch;
    if (name == "both")
        return DecodeMode::Both;
    throw std::invalid_argument("Unknown decode mode: " + name + " (expected greedy, beamsearch or both)");
}

const char* decodeModeName(DecodeMode mode)
{
    switch (mode)
    {
    case DecodeMode::Greedy: return "greedy";
    case DecodeMode::BeamSearch: return "beamsearch";
    case DecodeMode::Both: return "both";
    }
    return "unknown";
}

// ============================================================================
// Construction
// ============================================================================

TSPNetImpl::TSPNetImpl(const TspNetConfig& config)
    : config_(config)
{
    validateConfig(config_);

    const auto dim_emb = config_.dim_emb;
    const auto kv_width = config_.nb_layers_decoder * dim_emb;

    input_emb_ = register_module("input_emb", makeNodeEmbedding(config_));
    encoder_ = register_module("encoder", Encoder(config_.nb_layers_encoder, dim_emb, config_.nb_heads,
                                                  config_.dim_ff, config_.batchnorm));
    start_placeholder_ = register_parameter("start_placeholder", torch::randn({dim_emb}));
    decoder_ = register_module("decoder", Decoder(dim_emb, config_.nb_heads, config_.nb_layers_decoder,
                                                  config_.segm_len, config_.final_clip_value));
    wk_att_decoder_ = register_module("WK_att_decoder", torch::nn::Linear(dim_emb, kv_width));
    wv_att_decoder_ = register_module("WV_att_decoder", torch::nn::Linear(dim_emb, kv_width));
    pe_ = register_buffer("PE", sinusoidalPositionalEncoding(dim_emb, config_.max_len_pe));

    if (config_.verbose)
    {
        std::cout << "[TSPNet] Constructed: " << embeddingKindName(config_.embedding) << " embedding, "
                  << config_.nb_layers_encoder << " encoder layers, " << dim_emb << "d, "
                  << config_.nb_heads << " heads, " << config_.nb_layers_decoder << " decoder layers";
        if (config_.segm_len)
            std::cout << ", window " << *config_.segm_len;
        std::cout << std::endl;
    }
}

// ============================================================================
// Encoding
// ============================================================================

EncodedInstance TSPNetImpl::encode(const torch::Tensor& coords)
{
    if (coords.dim() != 3 || coords.size(2) != config_.dim_input_nodes)
    {
        throw std::invalid_argument("Coordinates must be [bsz, nb_nodes, " +
                                    std::to_string(config_.dim_input_nodes) + "], got " +
                                    std::to_string(coords.dim()) + " dims");
    }
    const auto bsz = coords.size(0);
    const auto nb_nodes = coords.size(1);
    if (bsz < 1 || nb_nodes < 1)
        throw std::invalid_argument("Coordinates must hold at least one instance with one node");
    if (nb_nodes + 1 > config_.max_len_pe)
    {
        throw std::invalid_argument(std::to_string(nb_nodes) + " nodes exceed max_len_pe=" +
                                    std::to_string(config_.max_len_pe));
    }

    auto h = input_emb_->forward(coords.to(start_placeholder_.dtype()));
    auto start = start_placeholder_.view({1, 1, config_.dim_emb}).expand({bsz, 1, config_.dim_emb});
    h = torch::cat({h, start}, 1);

    EncodedInstance context;
    context.h_encoder = encoder_->forward(h).embeddings;
    context.k_att = wk_att_decoder_->forward(context.h_encoder);
    context.v_att = wv_att_decoder_->forward(context.h_encoder);
    context.nb_nodes = nb_nodes;
    return context;
}

// ============================================================================
// Decoding
// ============================================================================

GreedySession TSPNetImpl::greedySession(const EncodedInstance& context, bool deterministic)
{
    return GreedySession(decoder_, context, pe_, deterministic);
}

BeamSearchSession TSPNetImpl::beamSearchSession(const EncodedInstance& context, int64_t beam_width)
{
    return BeamSearchSession(decoder_, context, pe_, beam_width);
}

DecodeResult TSPNetImpl::forward(const torch::Tensor& coords, const DecodeOptions& options)
{
    auto context = encode(coords);

    auto runGreedy = [&]()
    {
        auto session = greedySession(context, options.deterministic);
        while (!session.finished())
            session.step();
        return session.finish();
    };
    auto runBeamSearch = [&]()
    {
        auto session = beamSearchSession(context, options.beam_width);
        while (!session.finished())
            session.step();
        return session.finish();
    };

    switch (options.mode)
    {
    case DecodeMode::Greedy:
        return runGreedy();
    case DecodeMode::BeamSearch:
        return runBeamSearch();
    case DecodeMode::Both:
    {
        // Sessions are created per run, so the beam search starts from a fresh cache.
        CombinedResult both;
        both.greedy = runGreedy();
        both.beam_search = runBeamSearch();
        return both;
    }
    }
    throw std::invalid_argument("Unknown decode mode");
}

} // namespace tsp
