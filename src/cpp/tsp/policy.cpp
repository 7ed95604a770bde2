#include "policy.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>

namespace tsp
{

using torch::indexing::Slice;

namespace
{

// Runs in the member initializer list, before any size of the context is read.
const EncodedInstance& checkedContext(const Decoder& decoder, const EncodedInstance& context,
                                      const torch::Tensor& pe)
{
    if (decoder.is_empty())
        throw std::invalid_argument("Decoding needs a constructed decoder");
    if (context.nb_nodes < 1)
        throw std::invalid_argument("Decoding needs at least one node");

    const auto dim_emb = decoder->dimEmb();
    const auto& h = context.h_encoder;
    if (!h.defined() || h.dim() != 3 || h.size(1) != context.nb_nodes + 1 || h.size(2) != dim_emb)
    {
        throw std::invalid_argument("Encoder output must be [bsz, " + std::to_string(context.nb_nodes + 1) +
                                    ", " + std::to_string(dim_emb) + "]");
    }
    const auto& k = context.k_att;
    const auto& v = context.v_att;
    if (!k.defined() || !v.defined() || k.dim() != 3 || v.dim() != 3 ||
        k.size(0) != h.size(0) || v.size(0) != h.size(0))
        throw std::invalid_argument("Cross-attention keys/values do not match the encoder batch size");
    // Step t reads pe[t + 1], so rows 0..nb_nodes are needed.
    if (!pe.defined() || pe.dim() != 2 || pe.size(0) < context.nb_nodes + 1 || pe.size(1) != dim_emb)
    {
        throw std::invalid_argument("Positional encoding table too short for " +
                                    std::to_string(context.nb_nodes) + " nodes");
    }
    return context;
}

torch::Tensor startQuery(const EncodedInstance& context, const torch::Tensor& pe)
{
    return context.h_encoder.select(1, context.startIndex()) + pe.select(0, 0);
}

torch::Tensor startMask(const EncodedInstance& context)
{
    auto mask = torch::zeros({context.batchSize(), context.nb_nodes + 1},
                             torch::TensorOptions().dtype(torch::kBool).device(context.h_encoder.device()));
    mask.index_put_({Slice(), context.startIndex()}, true);
    return mask;
}

} // anonymous namespace

std::pair<torch::Tensor, torch::Tensor> topkStable(const torch::Tensor& scores, int64_t k)
{
    if (scores.dim() != 2)
        throw std::invalid_argument("topkStable expects [rows, candidates]");
    if (k < 1 || k > scores.size(1))
    {
        throw std::invalid_argument("topkStable: k=" + std::to_string(k) + " out of range for " +
                                    std::to_string(scores.size(1)) + " candidates");
    }

    torch::Tensor values, indices;
    std::tie(values, indices) = scores.sort(c10::optional<bool>(true), /*dim=*/1, /*descending=*/true);
    return {values.narrow(1, 0, k), indices.narrow(1, 0, k)};
}

// ============================================================================
// GreedySession
// ============================================================================

GreedySession::GreedySession(Decoder decoder, const EncodedInstance& context,
                             const torch::Tensor& positional_encoding, bool deterministic)
    : decoder_(std::move(decoder))
    , context_(checkedContext(decoder_, context, positional_encoding))
    , pe_(positional_encoding)
    , deterministic_(deterministic)
    , nb_nodes_(context_.nb_nodes)
    , bsz_(context_.batchSize())
    , cache_(decoder_->makeCache())
{
    batch_idx_ = torch::arange(bsz_, torch::TensorOptions().dtype(torch::kLong).device(context_.h_encoder.device()));
    h_t_ = startQuery(context_, pe_);
    mask_ = startMask(context_);
    cache_.reset();
}

void GreedySession::step()
{
    if (finished())
        throw std::logic_error("GreedySession: all " + std::to_string(nb_nodes_) + " nodes already decoded");

    auto prob = decoder_->forward(h_t_, context_.k_att, context_.v_att, mask_, cache_);

    torch::Tensor idx;
    if (deterministic_)
        idx = prob.argmax(1);
    else
        idx = torch::multinomial(prob, 1).squeeze(1);

    tour_.push_back(idx);
    log_probs_.push_back(prob.gather(1, idx.unsqueeze(1)).squeeze(1).log());

    h_t_ = context_.h_encoder.index({batch_idx_, idx}) + pe_.select(0, step_ + 1);
    mask_ = mask_.scatter(1, idx.unsqueeze(1), true);
    step_++;
}

torch::Tensor GreedySession::partialTour() const
{
    if (tour_.empty())
        return torch::empty({bsz_, 0}, torch::TensorOptions().dtype(torch::kLong).device(mask_.device()));
    return torch::stack(tour_, 1);
}

GreedyResult GreedySession::finish()
{
    if (!finished())
    {
        throw std::logic_error("GreedySession: finish() after " + std::to_string(step_) + " of " +
                               std::to_string(nb_nodes_) + " steps");
    }
    return {torch::stack(tour_, 1), torch::stack(log_probs_, 1).sum(1)};
}

// ============================================================================
// BeamSearchSession
// ============================================================================

BeamSearchSession::BeamSearchSession(Decoder decoder, const EncodedInstance& context,
                                     const torch::Tensor& positional_encoding, int64_t beam_width)
    : decoder_(std::move(decoder))
    , context_(checkedContext(decoder_, context, positional_encoding))
    , pe_(positional_encoding)
    , beam_width_(beam_width)
    , nb_nodes_(context_.nb_nodes)
    , bsz_(context_.batchSize())
    , cache_(decoder_->makeCache())
{
    if (beam_width_ < 1)
        throw std::invalid_argument("Beam width must be at least 1, got " + std::to_string(beam_width_));
    // Step 1 sees at most min(B, N) * (N - 1) distinct extensions.
    if (nb_nodes_ > 1 && beam_width_ > nb_nodes_ * (nb_nodes_ - 1))
    {
        throw std::invalid_argument("Beam width " + std::to_string(beam_width_) + " exceeds " +
                                    std::to_string(nb_nodes_ * (nb_nodes_ - 1)) + " partial tours for " +
                                    std::to_string(nb_nodes_) + " nodes");
    }

    const auto device = context_.h_encoder.device();
    batch_idx_ = torch::arange(bsz_, torch::TensorOptions().dtype(torch::kLong).device(device)).unsqueeze(1);
    h_t_ = startQuery(context_, pe_).unsqueeze(1);
    mask_ = startMask(context_).unsqueeze(1);
    tours_ = torch::zeros({bsz_, 1, nb_nodes_}, torch::TensorOptions().dtype(torch::kLong).device(device));
    scores_ = torch::zeros({bsz_, 1}, context_.h_encoder.options());
    parents_ = torch::zeros({bsz_, 1}, tours_.options());
    k_att_ = context_.k_att;
    v_att_ = context_.v_att;
    cache_.reset();
}

void BeamSearchSession::step()
{
    if (finished())
        throw std::logic_error("BeamSearchSession: all " + std::to_string(nb_nodes_) + " nodes already decoded");

    if (step_ == 0)
        firstStep();
    else
        expandStep();
    step_++;
}

void BeamSearchSession::firstStep()
{
    const auto dim_emb = h_t_.size(2);
    auto prob = decoder_->forward(h_t_.reshape({bsz_, dim_emb}), k_att_, v_att_,
                                  mask_.reshape({bsz_, nb_nodes_ + 1}), cache_);

    // Only nb_nodes first moves exist; wider requests are clamped here.
    const auto width = std::min(beam_width_, nb_nodes_);
    auto top = topkStable(prob.log(), width);
    const auto& top_idx = top.second;

    scores_ = top.first;
    parents_ = torch::zeros_like(top_idx);
    mask_ = mask_.expand({bsz_, width, nb_nodes_ + 1}).clone().scatter(2, top_idx.unsqueeze(2), true);
    tours_ = torch::zeros({bsz_, width, nb_nodes_}, tours_.options());
    tours_.index_put_({Slice(), Slice(), 0}, top_idx);
    h_t_ = context_.h_encoder.index({batch_idx_, top_idx}) + pe_.select(0, 1);

    cache_.repeat(width);
    k_att_ = context_.k_att.repeat_interleave(width, 0);
    v_att_ = context_.v_att.repeat_interleave(width, 0);
    width_ = width;
}

void BeamSearchSession::expandStep()
{
    const auto dim_emb = h_t_.size(2);
    const auto nb_cand = nb_nodes_ + 1;
    const auto rows = bsz_ * width_;

    auto prob = decoder_->forward(h_t_.reshape({rows, dim_emb}), k_att_, v_att_,
                                  mask_.reshape({rows, nb_cand}), cache_);

    // Every (beam, next node) pair competes for the `beam_width_` slots of its batch row.
    auto total = prob.log().reshape({bsz_, width_, nb_cand}) + scores_.unsqueeze(2);
    auto top = topkStable(total.reshape({bsz_, width_ * nb_cand}), beam_width_);
    const auto& top_idx = top.second;

    auto beam = top_idx.div(nb_cand, /*rounding_mode=*/"floor");
    auto node = top_idx - beam * nb_cand;

    // Gather from the previous step's bookkeeping before writing this step's node.
    mask_ = mask_.index({batch_idx_, beam}).scatter(2, node.unsqueeze(2), true);
    tours_ = tours_.index({batch_idx_, beam});
    tours_.index_put_({Slice(), Slice(), step_}, node);
    scores_ = top.first;
    parents_ = beam;
    h_t_ = context_.h_encoder.index({batch_idx_, node}) + pe_.select(0, step_ + 1);

    cache_.reorder(step_, beam);
    if (width_ != beam_width_)
    {
        k_att_ = context_.k_att.repeat_interleave(beam_width_, 0);
        v_att_ = context_.v_att.repeat_interleave(beam_width_, 0);
    }
    width_ = beam_width_;
}

BeamSearchResult BeamSearchSession::finish()
{
    if (!finished())
    {
        throw std::logic_error("BeamSearchSession: finish() after " + std::to_string(step_) + " of " +
                               std::to_string(nb_nodes_) + " steps");
    }
    return {tours_.select(1, 0), scores_.select(1, 0), tours_, scores_};
}

} // namespace tsp
