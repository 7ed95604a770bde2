#pragma once

#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "decoder.hpp"
#include "kv_cache.hpp"

namespace tsp
{

/// Encoder output of one forward pass; read-only while decoding.
struct EncodedInstance
{
    torch::Tensor h_encoder;  // [bsz, nb_nodes+1, dim_emb], start token at index nb_nodes
    torch::Tensor k_att;      // [bsz, nb_nodes+1, nb_layers_decoder * dim_emb]
    torch::Tensor v_att;      // [bsz, nb_nodes+1, nb_layers_decoder * dim_emb]
    int64_t nb_nodes{0};

    int64_t batchSize() const { return h_encoder.size(0); }
    int64_t startIndex() const { return nb_nodes; }
};

struct GreedyResult
{
    torch::Tensor tours;   // int64 [bsz, nb_nodes]
    torch::Tensor scores;  // [bsz], sum of log-probabilities of the chosen nodes
};

struct BeamSearchResult
{
    torch::Tensor tours;        // int64 [bsz, nb_nodes], best beam
    torch::Tensor scores;       // [bsz], best beam cumulative log-probability
    torch::Tensor beam_tours;   // int64 [bsz, width, nb_nodes], beams sorted by score
    torch::Tensor beam_scores;  // [bsz, width], descending
};

struct CombinedResult
{
    GreedyResult greedy;
    BeamSearchResult beam_search;
};

using DecodeResult = std::variant<GreedyResult, BeamSearchResult, CombinedResult>;

/// Top-k along dim 1 through a stable descending sort, so equal scores keep
/// their input order (first seen wins). Returns {values, indices}.
std::pair<torch::Tensor, torch::Tensor> topkStable(const torch::Tensor& scores, int64_t k);

/// Single-path decoding: arg-max or categorical sampling, one node per step.
/// Construction begins the run (fresh cache, only the start token visited).
class GreedySession
{
public:
    GreedySession(Decoder decoder, const EncodedInstance& context,
                  const torch::Tensor& positional_encoding, bool deterministic = true);

    /// Decode one node for every batch row.
    void step();

    bool finished() const { return step_ >= nb_nodes_; }
    int64_t stepIndex() const { return step_; }

    /// bool [bsz, nb_nodes+1]
    const torch::Tensor& mask() const { return mask_; }
    const DecoderCache& cache() const { return cache_; }

    /// Nodes chosen so far: int64 [bsz, stepIndex()]
    torch::Tensor partialTour() const;

    /// Stack the tour and sum the log-probabilities. Requires finished().
    GreedyResult finish();

private:
    Decoder decoder_;
    EncodedInstance context_;
    torch::Tensor pe_;
    bool deterministic_;

    int64_t nb_nodes_;
    int64_t bsz_;
    int64_t step_{0};

    torch::Tensor batch_idx_;
    torch::Tensor h_t_;
    torch::Tensor mask_;
    DecoderCache cache_;
    std::vector<torch::Tensor> tour_;
    std::vector<torch::Tensor> log_probs_;
};

/// Batched beam search with the dynamic width schedule:
/// step 0 keeps min(width, nb_nodes) beams, every later step keeps `width`.
class BeamSearchSession
{
public:
    BeamSearchSession(Decoder decoder, const EncodedInstance& context,
                      const torch::Tensor& positional_encoding, int64_t beam_width);

    void step();

    bool finished() const { return step_ >= nb_nodes_; }
    int64_t stepIndex() const { return step_; }

    /// Beams currently kept per batch row (1 before the first step).
    int64_t beamWidth() const { return width_; }
    int64_t configuredWidth() const { return beam_width_; }

    /// bool [bsz, beamWidth(), nb_nodes+1]
    const torch::Tensor& mask() const { return mask_; }
    /// int64 [bsz, beamWidth(), nb_nodes]; positions >= stepIndex() are still 0.
    const torch::Tensor& tours() const { return tours_; }
    /// [bsz, beamWidth()], descending
    const torch::Tensor& scores() const { return scores_; }
    /// int64 [bsz, beamWidth()]: beam index, in the previous step's ordering, that each
    /// beam was extended from during the last step.
    const torch::Tensor& parents() const { return parents_; }
    const DecoderCache& cache() const { return cache_; }

    /// Best beam (index 0) plus all beams. Requires finished().
    BeamSearchResult finish();

private:
    void firstStep();
    void expandStep();

    Decoder decoder_;
    EncodedInstance context_;
    torch::Tensor pe_;
    int64_t beam_width_;

    int64_t nb_nodes_;
    int64_t bsz_;
    int64_t step_{0};
    int64_t width_{1};

    torch::Tensor batch_idx_;  // [bsz, 1]
    torch::Tensor h_t_;        // [bsz, width, dim_emb]
    torch::Tensor mask_;
    torch::Tensor tours_;
    torch::Tensor scores_;
    torch::Tensor parents_;
    torch::Tensor k_att_;      // context keys tiled to bsz * width rows
    torch::Tensor v_att_;
    DecoderCache cache_;
};

} // namespace tsp
