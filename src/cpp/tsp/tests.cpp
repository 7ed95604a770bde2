#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <doctest/doctest.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "attention.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "embedding.hpp"
#include "encoder.hpp"
#include "kv_cache.hpp"
#include "positional_encoding.hpp"
#include "tour_length.hpp"

namespace
{

torch::Tensor points(std::initializer_list<float> xy)
{
    auto t = torch::tensor(std::vector<float>(xy), torch::kFloat32);
    return t.view({1, -1, 2});
}

torch::Tensor tour(std::initializer_list<int64_t> nodes)
{
    return torch::tensor(std::vector<int64_t>(nodes), torch::kLong).view({1, -1});
}

} // namespace

// ============================================================================
// Tour length
// ============================================================================

TEST_CASE("tour length of the unit square")
{
    auto square = points({0, 0, 1, 0, 1, 1, 0, 1});
    CHECK(tsp::computeTourLength(square, tour({0, 1, 2, 3}))[0].item<double>() == 4.0);
    CHECK(tsp::computeTourLength(square, tour({0, 2, 1, 3}))[0].item<double>() ==
          doctest::Approx(2.0 + 2.0 * std::sqrt(2.0)).epsilon(1e-5));
}

TEST_CASE("tour length closes the cycle for colinear points")
{
    auto line = points({0, 0, 1, 0, 2, 0});
    CHECK(tsp::computeTourLength(line, tour({0, 1, 2}))[0].item<double>() == doctest::Approx(4.0));
    CHECK(tsp::computeTourLength(line, tour({1, 0, 2}))[0].item<double>() == doctest::Approx(4.0));
}

TEST_CASE("tour length rejects a batch mismatch")
{
    auto square = points({0, 0, 1, 0, 1, 1, 0, 1});
    auto two_tours = torch::tensor(std::vector<int64_t>{0, 1, 2, 3, 3, 2, 1, 0}, torch::kLong).view({2, 4});
    CHECK_THROWS_AS(tsp::computeTourLength(square, two_tours), std::invalid_argument);
}

TEST_CASE("shortest beam is picked by length, not by position")
{
    auto square = points({0, 0, 1, 0, 1, 1, 0, 1});
    auto beams = torch::tensor(std::vector<int64_t>{0, 2, 1, 3, 0, 1, 2, 3}, torch::kLong).view({1, 2, 4});

    auto lengths = tsp::computeBeamTourLengths(square, beams);
    REQUIRE(lengths.sizes() == torch::IntArrayRef({1, 2}));
    CHECK(lengths[0][1].item<double>() == doctest::Approx(4.0));

    auto best = tsp::shortestBeamTours(square, beams);
    CHECK(best.beam[0].item<int64_t>() == 1);
    CHECK(best.lengths[0].item<double>() == doctest::Approx(4.0));
    CHECK(torch::equal(best.tours, tour({0, 1, 2, 3})));
}

// ============================================================================
// Attention
// ============================================================================

TEST_CASE("masked positions receive zero attention")
{
    torch::manual_seed(0);
    auto q = torch::randn({2, 1, 8});
    auto kv = torch::randn({2, 5, 8});
    auto mask = torch::zeros({2, 5}, torch::kBool);
    mask.index_put_({0, 1}, true);
    mask.index_put_({1, 4}, true);

    auto out = tsp::multiHeadAttention(q, kv, kv, 2, mask);
    REQUIRE(out.output.sizes() == torch::IntArrayRef({2, 1, 8}));
    REQUIRE(out.weights.sizes() == torch::IntArrayRef({2, 1, 5}));
    CHECK(out.weights[0][0][1].item<float>() == 0.0F);
    CHECK(out.weights[1][0][4].item<float>() == 0.0F);
    CHECK(torch::allclose(out.weights.sum(-1), torch::ones({2, 1})));
}

TEST_CASE("single-head output is the weighted sum of values")
{
    torch::manual_seed(1);
    auto q = torch::randn({1, 1, 4});
    auto k = torch::randn({1, 3, 4});
    auto v = torch::randn({1, 3, 4});

    auto out = tsp::multiHeadAttention(q, k, v, 1);
    CHECK(torch::allclose(out.output, out.weights.matmul(v), 1e-5, 1e-6));
}

TEST_CASE("clip squashes logits through tanh")
{
    auto q = torch::tensor(std::vector<float>{100, 0}).view({1, 1, 2});
    auto k = torch::tensor(std::vector<float>{100, 0, -100, 0}).view({1, 2, 2});

    auto clipped = tsp::multiHeadAttention(q, k, k, 1, {}, 1.0);
    const double expected = std::exp(1.0) / (std::exp(1.0) + std::exp(-1.0));
    CHECK(clipped.weights[0][0][0].item<double>() == doctest::Approx(expected).epsilon(1e-4));

    auto unclipped = tsp::multiHeadAttention(q, k, k, 1);
    CHECK(unclipped.weights[0][0][0].item<double>() == doctest::Approx(1.0));
}

TEST_CASE("attention rejects indivisible heads and batch mismatch")
{
    auto q = torch::randn({1, 1, 6});
    auto kv = torch::randn({1, 3, 6});
    CHECK_THROWS_AS(tsp::multiHeadAttention(q, kv, kv, 4), std::invalid_argument);
    CHECK_THROWS_AS(tsp::multiHeadAttention(q, torch::randn({2, 3, 6}), torch::randn({2, 3, 6}), 2),
                    std::invalid_argument);
}

// ============================================================================
// Positional encoding
// ============================================================================

TEST_CASE("sinusoidal table starts with sin(0)=0, cos(0)=1")
{
    auto pe = tsp::sinusoidalPositionalEncoding(6, 10);
    REQUIRE(pe.sizes() == torch::IntArrayRef({10, 6}));
    CHECK(pe[0][0].item<double>() == doctest::Approx(0.0));
    CHECK(pe[0][1].item<double>() == doctest::Approx(1.0));
    CHECK(pe[1][0].item<double>() == doctest::Approx(std::sin(1.0)));
    CHECK(pe[1][1].item<double>() == doctest::Approx(std::cos(1.0)));

    auto odd = tsp::sinusoidalPositionalEncoding(5, 4);
    CHECK(odd.sizes() == torch::IntArrayRef({4, 5}));
}

// ============================================================================
// Config
// ============================================================================

TEST_CASE("parseConfig overrides defaults")
{
    const std::string json = R"({
        "embedding": "conv",
        "nb_neighbors": 4,
        "kernel_size": 5,
        "dim_emb": 64,
        "nb_heads": 4,
        "nb_layers_decoder": 3,
        "segm_len": 8,
        "batchnorm": false,
        "final_clip_value": 5.5
    })";
    auto config = tsp::parseConfig(json);
    CHECK(config.embedding == tsp::EmbeddingKind::NeighborConv);
    CHECK(config.nb_neighbors == 4);
    CHECK(config.kernel_size == 5);
    CHECK(config.dim_emb == 64);
    CHECK(config.nb_heads == 4);
    CHECK(config.nb_layers_decoder == 3);
    REQUIRE(config.segm_len.has_value());
    CHECK(*config.segm_len == 8);
    CHECK(!config.batchnorm);
    CHECK(config.final_clip_value == doctest::Approx(5.5));
    CHECK(config.dim_ff == 512);
    CHECK(config.nb_layers_encoder == 6);
    CHECK_NOTHROW(tsp::validateConfig(config));
}

TEST_CASE("null segm_len means an unbounded cache")
{
    auto config = tsp::parseConfig(R"({"segm_len": null, "dim_emb": 32})");
    CHECK(!config.segm_len.has_value());
    CHECK(config.dim_emb == 32);
}

TEST_CASE("loadConfig reads a file and reports missing ones")
{
    const std::string path = "tsp_tests_config.json";
    {
        std::ofstream out(path);
        out << R"({"embedding": "convXY", "nb_neighbors": 2, "kernel_size": 3, "verbose": false})";
    }
    auto config = tsp::loadConfig(path);
    std::remove(path.c_str());
    CHECK(config.embedding == tsp::EmbeddingKind::NeighborConvXY);
    CHECK(!config.verbose);

    CHECK_THROWS_AS(tsp::loadConfig("does/not/exist.json"), std::runtime_error);
}

TEST_CASE("validateConfig rejects inconsistent options")
{
    tsp::TspNetConfig config;
    CHECK_NOTHROW(tsp::validateConfig(config));

    auto heads = config;
    heads.nb_heads = 3;
    CHECK_THROWS_AS(tsp::validateConfig(heads), std::invalid_argument);

    auto window = config;
    window.segm_len = 0;
    CHECK_THROWS_AS(tsp::validateConfig(window), std::invalid_argument);

    auto decoder = config;
    decoder.nb_layers_decoder = 0;
    CHECK_THROWS_AS(tsp::validateConfig(decoder), std::invalid_argument);

    auto kernel = config;
    kernel.embedding = tsp::EmbeddingKind::NeighborConv;
    kernel.nb_neighbors = 4;
    kernel.kernel_size = 3;
    CHECK_THROWS_AS(tsp::validateConfig(kernel), std::invalid_argument);

    CHECK_THROWS_AS(tsp::parseEmbeddingKind("transformer"), std::invalid_argument);
    CHECK_THROWS_AS(tsp::parseConfig(R"({"dim_emb": "wide"})"), std::runtime_error);
}

// ============================================================================
// Embeddings and encoder
// ============================================================================

TEST_CASE("neighbour windows are farthest first with the node itself last")
{
    auto line = points({0, 0, 1, 0, 3, 0, 6, 0});
    auto windows = tsp::gatherNeighborWindows(line, 1);
    REQUIRE(windows.sizes() == torch::IntArrayRef({1, 4, 2, 2}));
    // node 0: nearest other node is 1
    CHECK(windows[0][0][0][0].item<float>() == 1.0F);
    CHECK(windows[0][0][1][0].item<float>() == 0.0F);
    // node 3: nearest other node is 2
    CHECK(windows[0][3][0][0].item<float>() == 3.0F);
    CHECK(windows[0][3][1][0].item<float>() == 6.0F);

    CHECK_THROWS_AS(tsp::gatherNeighborWindows(line, 4), std::invalid_argument);
}

TEST_CASE("every embedding produces one vector per node")
{
    torch::manual_seed(2);
    auto coords = torch::rand({3, 7, 2});

    for (auto kind : {tsp::EmbeddingKind::Linear, tsp::EmbeddingKind::NeighborConv,
                      tsp::EmbeddingKind::ConvSamePadding, tsp::EmbeddingKind::ConvLinear,
                      tsp::EmbeddingKind::NeighborConvXY})
    {
        CAPTURE(tsp::embeddingKindName(kind));
        tsp::TspNetConfig config;
        config.embedding = kind;
        config.dim_emb = 16;
        config.nb_neighbors = 2;
        config.kernel_size = 3;
        auto embedding = tsp::makeNodeEmbedding(config);
        auto h = embedding->forward(coords);
        CHECK(h.sizes() == torch::IntArrayRef({3, 7, 16}));
    }
}

TEST_CASE("linear embedding preserves node order")
{
    torch::manual_seed(3);
    tsp::LinearEmbeddingImpl embedding(2, 8);
    auto coords = torch::rand({1, 5, 2});
    auto perm = torch::tensor(std::vector<int64_t>{4, 2, 0, 1, 3}, torch::kLong);

    auto h = embedding.forward(coords);
    auto h_perm = embedding.forward(coords.index_select(1, perm));
    CHECK(torch::allclose(h.index_select(1, perm), h_perm));
}

TEST_CASE("feature norm selects batch- or layer-style normalization")
{
    torch::manual_seed(6);
    auto h = torch::randn({2, 5, 8});

    tsp::FeatureNorm batch(8, true);
    CHECK(batch->isBatchNorm());
    batch->train();
    auto out = batch->forward(h);
    REQUIRE(out.sizes() == h.sizes());
    // each feature normalized over (bsz, len)
    CHECK(torch::allclose(out.mean({0, 1}), torch::zeros({8}), 1e-4, 1e-5));

    tsp::FeatureNorm layer(8, false);
    CHECK(!layer->isBatchNorm());
    auto out_layer = layer->forward(h);
    // each vector normalized over its features
    CHECK(torch::allclose(out_layer.mean(-1), torch::zeros({2, 5}), 1e-4, 1e-5));
}

TEST_CASE("encoder keeps the input shape for both normalizations")
{
    torch::manual_seed(4);
    for (bool batchnorm : {true, false})
    {
        CAPTURE(batchnorm);
        tsp::Encoder encoder(2, 16, 4, 32, batchnorm);
        encoder->eval();
        auto h = torch::randn({2, 6, 16});
        auto out = encoder->forward(h);
        CHECK(out.embeddings.sizes() == h.sizes());
        CHECK(out.attention.sizes() == torch::IntArrayRef({2, 6, 6}));
    }
    CHECK_THROWS_AS(tsp::Encoder(1, 10, 4, 16, true), std::invalid_argument);
}

// ============================================================================
// Self-attention cache
// ============================================================================

TEST_CASE("reset is idempotent")
{
    tsp::SelfAttentionCache cache;
    cache.append(torch::ones({2, 4}), torch::ones({2, 4}));
    REQUIRE(cache.length() == 1);

    cache.reset();
    CHECK(cache.empty());
    cache.reset();
    CHECK(cache.empty());
    CHECK(cache.length() == 0);
    CHECK(cache.rows() == 0);
}

TEST_CASE("sliding window keeps the most recent entries")
{
    tsp::SelfAttentionCache cache(2);
    for (int step = 0; step < 4; step++)
    {
        auto entry = torch::full({1, 1}, static_cast<float>(step));
        cache.append(entry, entry);
        CHECK(cache.length() == std::min(step + 1, 2));
        CHECK(cache.length() == cache.expectedLength(step));
    }
    CHECK(cache.keys()[0][0][0].item<float>() == 2.0F);
    CHECK(cache.keys()[0][1][0].item<float>() == 3.0F);
}

TEST_CASE("reorder gathers source beams per batch row")
{
    // bsz = 2, width = 2: rows hold 0, 1 | 2, 3
    tsp::SelfAttentionCache cache;
    auto rows = torch::arange(4, torch::kFloat32).view({4, 1});
    cache.append(rows, rows * 10);

    auto beam_idx = torch::tensor(std::vector<int64_t>{1, 1, 0, 1}, torch::kLong).view({2, 2});
    cache.reorder(0, beam_idx);

    auto keys = cache.keys().flatten();
    CHECK(keys[0].item<float>() == 1.0F);
    CHECK(keys[1].item<float>() == 1.0F);
    CHECK(keys[2].item<float>() == 2.0F);
    CHECK(keys[3].item<float>() == 3.0F);
    CHECK(cache.values().flatten()[3].item<float>() == 30.0F);
}

TEST_CASE("reorder can widen the cache")
{
    tsp::SelfAttentionCache cache;
    auto rows = torch::arange(4, torch::kFloat32).view({4, 1});  // bsz 2, width 2
    cache.append(rows, rows);

    auto beam_idx = torch::tensor(std::vector<int64_t>{0, 1, 1, 1, 0, 0}, torch::kLong).view({2, 3});
    cache.reorder(0, beam_idx);
    CHECK(cache.rows() == 6);
    auto keys = cache.keys().flatten();
    CHECK(keys[2].item<float>() == 1.0F);
    CHECK(keys[3].item<float>() == 3.0F);
    CHECK(keys[5].item<float>() == 2.0F);
}

TEST_CASE("repeat tiles rows contiguously")
{
    tsp::SelfAttentionCache cache;
    auto rows = torch::tensor(std::vector<float>{5, 7}).view({2, 1});
    cache.append(rows, rows);
    cache.repeat(3);

    auto keys = cache.keys().flatten();
    REQUIRE(keys.numel() == 6);
    CHECK(keys[2].item<float>() == 5.0F);
    CHECK(keys[3].item<float>() == 7.0F);
}

TEST_CASE("cache misuse is reported")
{
    tsp::SelfAttentionCache cache;
    auto beam_idx = torch::zeros({1, 2}, torch::kLong);
    CHECK_THROWS_AS(cache.reorder(0, beam_idx), std::logic_error);
    CHECK_THROWS_AS(cache.repeat(2), std::logic_error);

    cache.append(torch::ones({1, 4}), torch::ones({1, 4}));
    CHECK_THROWS_AS(cache.reorder(3, beam_idx), std::logic_error);
    CHECK_THROWS_AS(cache.append(torch::ones({2, 4}), torch::ones({2, 4})), std::invalid_argument);
    CHECK_THROWS_AS(tsp::SelfAttentionCache(0), std::invalid_argument);
}

TEST_CASE("decoder cache applies operations to every layer")
{
    tsp::DecoderCache cache(3, std::nullopt);
    CHECK(cache.numLayers() == 3);
    CHECK(cache.length() == 0);

    for (size_t l = 0; l < cache.numLayers(); l++)
        cache.layer(l).append(torch::ones({2, 4}), torch::ones({2, 4}));
    cache.repeat(2);
    CHECK(cache.rows() == 4);
    for (size_t l = 0; l < cache.numLayers(); l++)
        CHECK(cache.layer(l).rows() == 4);

    cache.reset();
    CHECK(cache.length() == 0);
    CHECK(cache.layer(2).empty());
}

// ============================================================================
// CLI
// ============================================================================

TEST_CASE("parse_cli populates demo options")
{
    const char* argv[] = {
        "tsp_demo", "--nodes", "20", "--batch", "4", "--beam-width", "3",
        "--mode", "beamsearch", "--sample", "--seed", "7", "--cpu",
    };
    const int argc = static_cast<int>(std::size(argv));
    auto options = tsp::parse_cli(argc, const_cast<char**>(argv));

    CHECK(options.nb_nodes == 20);
    CHECK(options.batch_size == 4);
    CHECK(options.beam_width == 3);
    CHECK(options.mode == tsp::DecodeMode::BeamSearch);
    CHECK(options.sample);
    CHECK(options.seed == 7);
    CHECK(options.force_cpu);
    CHECK(options.config_path.empty());
}

TEST_CASE("parse_cli rejects bad input")
{
    const char* unknown[] = {"tsp_demo", "--fen", "x"};
    CHECK_THROWS_AS(tsp::parse_cli(3, const_cast<char**>(unknown)), std::invalid_argument);

    const char* bad_int[] = {"tsp_demo", "--nodes", "ten"};
    CHECK_THROWS_AS(tsp::parse_cli(3, const_cast<char**>(bad_int)), std::invalid_argument);

    const char* bad_mode[] = {"tsp_demo", "--mode", "random"};
    CHECK_THROWS_AS(tsp::parse_cli(3, const_cast<char**>(bad_mode)), std::invalid_argument);

    const char* zero_width[] = {"tsp_demo", "--beam-width", "0"};
    CHECK_THROWS_AS(tsp::parse_cli(3, const_cast<char**>(zero_width)), std::invalid_argument);
}
