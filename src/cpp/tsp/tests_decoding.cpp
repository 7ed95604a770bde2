#include <doctest/doctest.h>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "decoder.hpp"
#include "policy.hpp"
#include "tour_length.hpp"
#include "tsp_net.hpp"

namespace
{

tsp::TspNetConfig smallConfig()
{
    tsp::TspNetConfig config;
    config.dim_emb = 16;
    config.dim_ff = 32;
    config.nb_heads = 4;
    config.nb_layers_encoder = 2;
    config.nb_layers_decoder = 3;
    config.max_len_pe = 64;
    config.verbose = false;
    return config;
}

tsp::TSPNet makeNet(tsp::TspNetConfig config = smallConfig())
{
    torch::manual_seed(42);
    tsp::TSPNet net(config);
    net->eval();
    return net;
}

// Every row of tours [rows, N] holds each of 0..N-1 exactly once.
bool isPermutation(const torch::Tensor& tours, int64_t nb_nodes)
{
    if (tours.size(-1) != nb_nodes)
        return false;
    auto sorted = std::get<0>(tours.reshape({-1, nb_nodes}).sort(-1));
    auto expected = torch::arange(nb_nodes, torch::kLong).expand_as(sorted);
    return torch::equal(sorted, expected);
}

// Decode every beam's tour on its own, forcing its choices, with a fresh cache.
// Returns the summed log-probabilities [bsz, width].
torch::Tensor replayLogProbs(tsp::TSPNet& net, const tsp::EncodedInstance& context,
                             const torch::Tensor& beam_tours)
{
    using torch::indexing::Slice;

    const auto bsz = beam_tours.size(0);
    const auto width = beam_tours.size(1);
    const auto nb_nodes = beam_tours.size(2);
    const auto rows = bsz * width;
    auto decoder = net->decoder();
    const auto& pe = net->positionalEncoding();

    auto h_encoder = context.h_encoder.repeat_interleave(width, 0);
    auto k_att = context.k_att.repeat_interleave(width, 0);
    auto v_att = context.v_att.repeat_interleave(width, 0);
    auto tours = beam_tours.reshape({rows, nb_nodes});
    auto row_idx = torch::arange(rows, torch::kLong);

    auto cache = decoder->makeCache();
    auto h_t = h_encoder.select(1, nb_nodes) + pe.select(0, 0);
    auto mask = torch::zeros({rows, nb_nodes + 1}, torch::kBool);
    mask.index_put_({Slice(), nb_nodes}, true);

    auto total = torch::zeros({rows});
    for (int64_t t = 0; t < nb_nodes; t++)
    {
        auto prob = decoder->forward(h_t, k_att, v_att, mask, cache);
        auto node = tours.select(1, t);
        total = total + prob.gather(1, node.unsqueeze(1)).squeeze(1).log();
        h_t = h_encoder.index({row_idx, node}) + pe.select(0, t + 1);
        mask = mask.scatter(1, node.unsqueeze(1), true);
    }
    return total.view({bsz, width});
}

} // namespace

// ============================================================================
// Decoder stack
// ============================================================================

TEST_CASE("decoder output is a distribution that ignores visited nodes")
{
    torch::NoGradGuard no_grad;
    torch::manual_seed(5);
    tsp::Decoder decoder(16, 4, 3);
    auto cache = decoder->makeCache();
    CHECK(cache.numLayers() == 2);

    auto h_t = torch::randn({2, 16});
    auto k_att = torch::randn({2, 6, 48});
    auto v_att = torch::randn({2, 6, 48});
    auto mask = torch::zeros({2, 6}, torch::kBool);
    mask.index_put_({torch::indexing::Slice(), 5}, true);
    mask.index_put_({0, 2}, true);

    auto prob = decoder->forward(h_t, k_att, v_att, mask, cache);
    REQUIRE(prob.sizes() == torch::IntArrayRef({2, 6}));
    CHECK(torch::allclose(prob.sum(1), torch::ones({2})));
    CHECK(prob[0][2].item<float>() == 0.0F);
    CHECK(prob[0][5].item<float>() == 0.0F);
    CHECK(prob[1][5].item<float>() == 0.0F);
    CHECK(cache.length() == 1);
    CHECK(cache.rows() == 2);
}

TEST_CASE("decoder rejects mismatched inputs")
{
    torch::NoGradGuard no_grad;
    tsp::Decoder decoder(16, 4, 2);
    auto cache = decoder->makeCache();
    auto mask = torch::zeros({2, 6}, torch::kBool);

    // keys narrower than nb_layers * dim_emb
    CHECK_THROWS_AS(decoder->forward(torch::randn({2, 16}), torch::randn({2, 6, 16}), torch::randn({2, 6, 16}),
                                     mask, cache),
                    std::invalid_argument);
    // batch mismatch between query and keys
    CHECK_THROWS_AS(decoder->forward(torch::randn({3, 16}), torch::randn({2, 6, 32}), torch::randn({2, 6, 32}),
                                     mask, cache),
                    std::invalid_argument);

    tsp::DecoderCache wrong(5, std::nullopt);
    CHECK_THROWS_AS(decoder->forward(torch::randn({2, 16}), torch::randn({2, 6, 32}), torch::randn({2, 6, 32}),
                                     mask, wrong),
                    std::invalid_argument);
}

TEST_CASE("topkStable keeps first-seen order on ties")
{
    auto scores = torch::tensor(std::vector<float>{1, 2, 2, 0, 2}).view({1, 5});
    auto top = tsp::topkStable(scores, 3);
    CHECK(top.second[0][0].item<int64_t>() == 1);
    CHECK(top.second[0][1].item<int64_t>() == 2);
    CHECK(top.second[0][2].item<int64_t>() == 4);
    CHECK(top.first[0][2].item<float>() == 2.0F);
    CHECK_THROWS_AS(tsp::topkStable(scores, 6), std::invalid_argument);
}

// ============================================================================
// Greedy decoding
// ============================================================================

TEST_CASE("greedy tours are permutations")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto coords = torch::rand({4, 9, 2});

    auto result = net->forward(coords);
    REQUIRE(std::holds_alternative<tsp::GreedyResult>(result));
    const auto& greedy = std::get<tsp::GreedyResult>(result);
    CHECK(greedy.tours.sizes() == torch::IntArrayRef({4, 9}));
    CHECK(greedy.scores.sizes() == torch::IntArrayRef({4}));
    CHECK(isPermutation(greedy.tours, 9));
    CHECK((greedy.scores <= 0).all().item<bool>());
}

TEST_CASE("sampled tours are permutations too")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto coords = torch::rand({3, 7, 2});

    tsp::DecodeOptions options;
    options.deterministic = false;
    auto result = net->forward(coords, options);
    CHECK(isPermutation(std::get<tsp::GreedyResult>(result).tours, 7));
}

TEST_CASE("greedy session: mask grows monotonically and the cache follows the window")
{
    torch::NoGradGuard no_grad;
    auto config = smallConfig();
    config.segm_len = 3;
    auto net = makeNet(config);
    auto context = net->encode(torch::rand({2, 6, 2}));

    auto session = net->greedySession(context);
    CHECK(session.stepIndex() == 0);
    CHECK(session.cache().length() == 0);
    CHECK(session.mask().sum().item<int64_t>() == 2);  // start token only

    while (!session.finished())
    {
        const auto t = session.stepIndex();
        auto previous = session.mask().clone();
        session.step();

        // once visited, always visited; exactly one new node per row
        CHECK(!(previous & session.mask().logical_not()).any().item<bool>());
        CHECK(torch::equal(session.mask().sum(1) - previous.sum(1), torch::ones({2}, torch::kLong)));
        CHECK(session.cache().length() == std::min<int64_t>(t + 1, 3));
        CHECK(session.partialTour().size(1) == t + 1);
    }
    CHECK(session.mask().all().item<bool>());

    auto result = session.finish();
    CHECK(isPermutation(result.tours, 6));
    CHECK_THROWS_AS(session.step(), std::logic_error);
}

TEST_CASE("unbounded cache grows by one entry per step")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto session = net->greedySession(net->encode(torch::rand({1, 5, 2})));
    for (int64_t t = 0; t < 5; t++)
    {
        session.step();
        CHECK(session.cache().length() == t + 1);
    }
}

TEST_CASE("finishing early is an error")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto context = net->encode(torch::rand({1, 4, 2}));

    auto greedy = net->greedySession(context);
    greedy.step();
    CHECK_THROWS_AS(greedy.finish(), std::logic_error);

    auto beams = net->beamSearchSession(context, 2);
    CHECK_THROWS_AS(beams.finish(), std::logic_error);
}

TEST_CASE("three colinear cities give a closed tour of length 4 with any embedding")
{
    torch::NoGradGuard no_grad;
    auto coords = torch::tensor(std::vector<float>{0, 0, 1, 0, 2, 0}).view({1, 3, 2});

    for (auto kind : {tsp::EmbeddingKind::Linear, tsp::EmbeddingKind::NeighborConv,
                      tsp::EmbeddingKind::ConvSamePadding, tsp::EmbeddingKind::ConvLinear,
                      tsp::EmbeddingKind::NeighborConvXY})
    {
        CAPTURE(tsp::embeddingKindName(kind));
        auto config = smallConfig();
        config.embedding = kind;
        config.nb_neighbors = 2;
        config.kernel_size = 3;
        auto net = makeNet(config);

        auto result = std::get<tsp::GreedyResult>(net->forward(coords));
        REQUIRE(result.tours.sizes() == torch::IntArrayRef({1, 3}));
        CHECK(isPermutation(result.tours, 3));
        CHECK(tsp::computeTourLength(coords, result.tours)[0].item<double>() == doctest::Approx(4.0));
    }
}

// ============================================================================
// Beam search
// ============================================================================

TEST_CASE("beam width schedule clamps the first step")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    const int64_t nb_nodes = 5;
    const int64_t width = 7;
    auto session = net->beamSearchSession(net->encode(torch::rand({2, nb_nodes, 2})), width);
    CHECK(session.beamWidth() == 1);

    session.step();
    CHECK(session.beamWidth() == std::min(width, nb_nodes));
    CHECK(session.cache().rows() == 2 * nb_nodes);

    while (!session.finished())
    {
        session.step();
        CHECK(session.beamWidth() == width);
        CHECK(session.tours().sizes() == torch::IntArrayRef({2, width, nb_nodes}));
        CHECK(session.mask().sizes() == torch::IntArrayRef({2, width, nb_nodes + 1}));
        CHECK(session.cache().rows() == 2 * width);
        CHECK(session.cache().length() == session.stepIndex());
    }
}

TEST_CASE("beam scores never increase and beams stay sorted")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto session = net->beamSearchSession(net->encode(torch::rand({3, 8, 2})), 4);

    torch::Tensor best;
    while (!session.finished())
    {
        session.step();
        const auto& scores = session.scores();
        CHECK((scores <= 0).all().item<bool>());
        if (scores.size(1) > 1)
        {
            auto diffs = scores.narrow(1, 0, scores.size(1) - 1) - scores.narrow(1, 1, scores.size(1) - 1);
            CHECK((diffs >= 0).all().item<bool>());
        }
        auto current = scores.select(1, 0);
        if (best.defined())
            CHECK((current <= best + 1e-6).all().item<bool>());
        best = current;
    }

    auto result = session.finish();
    CHECK(isPermutation(result.beam_tours, 8));
    CHECK(torch::equal(result.tours, result.beam_tours.select(1, 0)));
    CHECK(torch::allclose(result.scores, result.beam_scores.select(1, 0)));
}

TEST_CASE("every beam carries the history of its own parent")
{
    torch::NoGradGuard no_grad;

    // N = 5 with width 7: step 0 repeats the cache to 5 beams, step 1 widens it to 7.
    for (auto window : {std::optional<int64_t>(2), std::optional<int64_t>()})
    {
        CAPTURE(window.value_or(0));
        auto config = smallConfig();
        config.segm_len = window;
        auto net = makeNet(config);
        auto context = net->encode(torch::rand({2, 5, 2}));

        auto session = net->beamSearchSession(context, 7);
        CHECK(session.configuredWidth() == 7);
        CHECK(session.cache().layer(0).window() == window);
        while (!session.finished())
        {
            session.step();
            CHECK(session.cache().length() == session.cache().layer(0).expectedLength(session.stepIndex() - 1));
        }
        auto result = session.finish();

        auto replayed = replayLogProbs(net, context, result.beam_tours);
        CHECK(torch::allclose(replayed, result.beam_scores, 1e-4, 1e-4));
    }
}

TEST_CASE("beam scores never increase along each parent chain")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    const int64_t nb_nodes = 6;
    auto session = net->beamSearchSession(net->encode(torch::rand({3, nb_nodes, 2})), 5);

    while (!session.finished())
    {
        const auto t = session.stepIndex();
        auto prev_scores = session.scores().clone();
        auto prev_tours = session.tours().clone();
        session.step();

        const auto& parents = session.parents();
        REQUIRE(parents.sizes() == session.scores().sizes());
        CHECK((parents >= 0).all().item<bool>());
        CHECK((parents < prev_scores.size(1)).all().item<bool>());
        CHECK((session.scores() <= prev_scores.gather(1, parents) + 1e-6).all().item<bool>());

        // the first t nodes of every beam are its parent's partial tour
        if (t > 0)
        {
            auto inherited = prev_tours.gather(1, parents.unsqueeze(2).expand({3, parents.size(1), nb_nodes}));
            CHECK(torch::equal(session.tours().narrow(2, 0, t), inherited.narrow(2, 0, t)));
        }
    }
}

TEST_CASE("beam masks mark exactly the nodes of each partial tour")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto session = net->beamSearchSession(net->encode(torch::rand({1, 6, 2})), 3);

    for (int64_t t = 0; t < 3; t++)
        session.step();

    const auto width = session.beamWidth();
    for (int64_t b = 0; b < width; b++)
    {
        auto visited = session.mask()[0][b].narrow(0, 0, 6);
        auto expected = torch::zeros({6}, torch::kBool);
        expected.index_put_({session.tours()[0][b].narrow(0, 0, 3)}, true);
        CHECK(torch::equal(visited, expected));
        CHECK(session.mask()[0][b][6].item<bool>());
    }
}

TEST_CASE("beam search of width 1 follows the greedy path")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto coords = torch::rand({3, 7, 2});

    tsp::DecodeOptions options;
    options.mode = tsp::DecodeMode::Both;
    options.beam_width = 1;
    auto result = net->forward(coords, options);
    REQUIRE(std::holds_alternative<tsp::CombinedResult>(result));

    const auto& both = std::get<tsp::CombinedResult>(result);
    CHECK(torch::equal(both.greedy.tours, both.beam_search.tours));
    CHECK(torch::allclose(both.greedy.scores, both.beam_search.scores, 1e-4, 1e-5));
}

TEST_CASE("beam search returns every final beam")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto coords = torch::rand({2, 6, 2});

    tsp::DecodeOptions options;
    options.mode = tsp::DecodeMode::BeamSearch;
    options.beam_width = 5;
    auto result = net->forward(coords, options);
    REQUIRE(std::holds_alternative<tsp::BeamSearchResult>(result));

    const auto& beams = std::get<tsp::BeamSearchResult>(result);
    CHECK(beams.tours.sizes() == torch::IntArrayRef({2, 6}));
    CHECK(beams.beam_tours.sizes() == torch::IntArrayRef({2, 5, 6}));
    CHECK(beams.beam_scores.sizes() == torch::IntArrayRef({2, 5}));
    CHECK(isPermutation(beams.beam_tours, 6));

    auto shortest = tsp::shortestBeamTours(coords, beams.beam_tours);
    auto best_lengths = tsp::computeTourLength(coords, beams.tours);
    CHECK((shortest.lengths <= best_lengths + 1e-6).all().item<bool>());
}

TEST_CASE("single-node instances decode to [0]")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();
    auto coords = torch::rand({2, 1, 2});

    tsp::DecodeOptions options;
    options.mode = tsp::DecodeMode::Both;
    options.beam_width = 3;
    auto both = std::get<tsp::CombinedResult>(net->forward(coords, options));
    CHECK(torch::equal(both.greedy.tours, torch::zeros({2, 1}, torch::kLong)));
    CHECK(torch::equal(both.beam_search.tours, torch::zeros({2, 1}, torch::kLong)));
    CHECK(both.beam_search.beam_tours.size(1) == 1);
}

// ============================================================================
// Error taxonomy
// ============================================================================

TEST_CASE("malformed configuration stops construction")
{
    auto config = smallConfig();
    config.dim_emb = 18;
    CHECK_THROWS_AS(tsp::TSPNet{config}, std::invalid_argument);

    config = smallConfig();
    config.embedding = tsp::EmbeddingKind::NeighborConv;
    config.nb_neighbors = 3;
    config.kernel_size = 5;
    CHECK_THROWS_AS(tsp::TSPNet{config}, std::invalid_argument);
}

TEST_CASE("malformed inputs stop the forward pass")
{
    torch::NoGradGuard no_grad;
    auto net = makeNet();

    CHECK_THROWS_AS(net->forward(torch::rand({4, 2})), std::invalid_argument);
    CHECK_THROWS_AS(net->forward(torch::rand({1, 4, 3})), std::invalid_argument);
    CHECK_THROWS_AS(net->forward(torch::rand({1, 64, 2})), std::invalid_argument);

    tsp::DecodeOptions zero;
    zero.mode = tsp::DecodeMode::BeamSearch;
    zero.beam_width = 0;
    CHECK_THROWS_AS(net->forward(torch::rand({1, 4, 2}), zero), std::invalid_argument);

    tsp::DecodeOptions wide;
    wide.mode = tsp::DecodeMode::BeamSearch;
    wide.beam_width = 13;  // 4 nodes allow at most 4 * 3 partial tours
    CHECK_THROWS_AS(net->forward(torch::rand({1, 4, 2}), wide), std::invalid_argument);

    wide.beam_width = 12;
    CHECK_NOTHROW(net->forward(torch::rand({1, 4, 2}), wide));
}

TEST_CASE("neighbour embeddings need enough nodes")
{
    torch::NoGradGuard no_grad;
    auto config = smallConfig();
    config.embedding = tsp::EmbeddingKind::NeighborConv;
    config.nb_neighbors = 4;
    config.kernel_size = 5;
    auto net = makeNet(config);
    CHECK_THROWS_AS(net->forward(torch::rand({1, 3, 2})), std::invalid_argument);
}

TEST_CASE("parameters are registered for external optimizers")
{
    auto net = makeNet();
    auto named = net->named_parameters();
    CHECK(named.contains("start_placeholder"));
    CHECK(named.contains("WK_att_decoder.weight"));
    CHECK(named.contains("decoder.Wq_final.weight"));
    CHECK(net->named_buffers().contains("PE"));
    CHECK(net->positionalEncoding().sizes() == torch::IntArrayRef({64, 16}));
}

TEST_CASE("undefined or scalar tensors are rejected as invalid arguments")
{
    torch::NoGradGuard no_grad;
    tsp::Decoder decoder(16, 4, 2);
    auto cache = decoder->makeCache();
    auto h_t = torch::randn({2, 16});
    auto k_att = torch::randn({2, 6, 32});

    CHECK_THROWS_AS(decoder->forward(h_t, k_att, k_att, torch::Tensor(), cache), std::invalid_argument);
    CHECK_THROWS_AS(decoder->forward(h_t, k_att, k_att, torch::tensor(true), cache), std::invalid_argument);
    CHECK_THROWS_AS(decoder->forward(torch::Tensor(), k_att, k_att, torch::zeros({2, 6}, torch::kBool), cache),
                    std::invalid_argument);

    auto net = makeNet();
    tsp::EncodedInstance empty;
    empty.nb_nodes = 4;
    CHECK_THROWS_AS(net->greedySession(empty), std::invalid_argument);
    CHECK_THROWS_AS(net->beamSearchSession(empty, 2), std::invalid_argument);

    auto context = net->encode(torch::rand({1, 4, 2}));
    context.k_att = torch::Tensor();
    CHECK_THROWS_AS(net->greedySession(context), std::invalid_argument);
}

TEST_CASE("shipped configs load, validate and build")
{
    for (const std::string name : {"tsp50.json", "tsp100_convxy.json"})
    {
        CAPTURE(name);
        auto config = tsp::loadConfig(std::string(TSP_CONFIG_DIR) + "/" + name);
        CHECK_NOTHROW(tsp::validateConfig(config));
        config.verbose = false;

        tsp::TSPNet net(config);
        CHECK(net->config().dim_emb == config.dim_emb);
        CHECK(net->decoder()->numLayers() == config.nb_layers_decoder);
        CHECK(net->positionalEncoding().size(0) == config.max_len_pe);
    }

    auto convxy = tsp::loadConfig(std::string(TSP_CONFIG_DIR) + "/tsp100_convxy.json");
    CHECK(convxy.embedding == tsp::EmbeddingKind::NeighborConvXY);
    CHECK(convxy.segm_len == std::optional<int64_t>(50));
    CHECK(!convxy.batchnorm);
}
