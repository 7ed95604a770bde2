#include "embedding.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace tsp
{

namespace
{

torch::nn::Conv1d makeValidConv(int64_t in_channels, int64_t out_channels, int64_t kernel_size)
{
    return torch::nn::Conv1d(torch::nn::Conv1dOptions(in_channels, out_channels, kernel_size));
}

torch::nn::Conv1d makeSameConv(int64_t in_channels, int64_t out_channels, int64_t kernel_size)
{
    return torch::nn::Conv1d(
        torch::nn::Conv1dOptions(in_channels, out_channels, kernel_size).padding(torch::kSame));
}

// Run a valid Conv1d over every node's window: [bsz, N, W, D] -> [bsz, N, dim_emb]
torch::Tensor convolveWindows(torch::nn::Conv1d& conv, const torch::Tensor& windows)
{
    const auto bsz = windows.size(0);
    const auto n = windows.size(1);
    auto flat = windows.reshape({bsz * n, windows.size(2), windows.size(3)}).permute({0, 2, 1});
    auto out = conv->forward(flat);  // [bsz*N, dim_emb, 1]
    return out.reshape({bsz, n, -1});
}

// Reorder each window by ascending coordinate `axis`.
torch::Tensor sortWindows(const torch::Tensor& windows, int64_t axis)
{
    auto order = std::get<1>(windows.select(-1, axis).sort(c10::optional<bool>(true), /*dim=*/-1));
    return windows.gather(2, order.unsqueeze(-1).expand_as(windows));
}

} // anonymous namespace

torch::Tensor gatherNeighborWindows(const torch::Tensor& coords, int64_t nb_neighbors)
{
    if (coords.dim() != 3)
        throw std::invalid_argument("Node coordinates must be [bsz, nb_nodes, dim]");

    const auto bsz = coords.size(0);
    const auto n = coords.size(1);
    if (nb_neighbors + 1 > n)
    {
        throw std::invalid_argument("Neighbour window of " + std::to_string(nb_neighbors + 1) +
                                    " nodes requested on an instance with " + std::to_string(n) +
                                    " nodes");
    }

    auto dist = torch::cdist(coords, coords);  // [bsz, N, N]
    // Ascending top-k flipped: farthest of the k+1 first, the node itself last.
    auto knn = std::get<1>(dist.topk(nb_neighbors + 1, /*dim=*/-1, /*largest=*/false)).flip({-1});
    auto batch = torch::arange(bsz, knn.options()).view({bsz, 1, 1});
    return coords.index({batch, knn});  // [bsz, N, k+1, D]
}

// ============================================================================
// Linear
// ============================================================================

LinearEmbeddingImpl::LinearEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb)
    : proj_(register_module("proj", torch::nn::Linear(dim_input_nodes, dim_emb)))
{
}

torch::Tensor LinearEmbeddingImpl::forward(const torch::Tensor& coords)
{
    return proj_->forward(coords);
}

// ============================================================================
// Neighbour convolution
// ============================================================================

NeighborConvEmbeddingImpl::NeighborConvEmbeddingImpl(int64_t nb_neighbors, int64_t kernel_size,
                                                     int64_t dim_emb, int64_t dim_input_nodes)
    : nb_neighbors_(nb_neighbors)
    , conv_(register_module("conv", makeValidConv(dim_input_nodes, dim_emb, kernel_size)))
    , w1_(register_module("W1", torch::nn::Linear(dim_input_nodes, dim_emb)))
    , w2_(register_module("W2", torch::nn::Linear(dim_emb, dim_emb)))
{
}

torch::Tensor NeighborConvEmbeddingImpl::forward(const torch::Tensor& coords)
{
    auto node_embedding = w1_->forward(coords);
    auto windows = gatherNeighborWindows(coords, nb_neighbors_);
    return node_embedding + w2_->forward(convolveWindows(conv_, windows));
}

// ============================================================================
// Sequence convolutions
// ============================================================================

ConvSamePaddingEmbeddingImpl::ConvSamePaddingEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb,
                                                           int64_t kernel_size)
    : conv_(register_module("conv", makeSameConv(dim_input_nodes, dim_emb, kernel_size)))
{
}

torch::Tensor ConvSamePaddingEmbeddingImpl::forward(const torch::Tensor& coords)
{
    return conv_->forward(coords.permute({0, 2, 1})).permute({0, 2, 1});
}

ConvLinearEmbeddingImpl::ConvLinearEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb,
                                                 int64_t kernel_size)
    : conv_(register_module("conv", makeSameConv(dim_input_nodes, dim_emb, kernel_size)))
    , w1_(register_module("W1", torch::nn::Linear(dim_input_nodes, dim_emb)))
{
}

torch::Tensor ConvLinearEmbeddingImpl::forward(const torch::Tensor& coords)
{
    auto node_embedding = w1_->forward(coords);
    auto conv_embedding = conv_->forward(coords.permute({0, 2, 1})).permute({0, 2, 1});
    return node_embedding + conv_embedding;
}

// ============================================================================
// Neighbour convolution on x- and y-sorted windows
// ============================================================================

NeighborConvXYEmbeddingImpl::NeighborConvXYEmbeddingImpl(int64_t nb_neighbors, int64_t kernel_size,
                                                         int64_t dim_emb, int64_t dim_input_nodes)
    : nb_neighbors_(nb_neighbors)
    , conv_x_(register_module("conv_x", makeValidConv(dim_input_nodes, dim_emb, kernel_size)))
    , conv_y_(register_module("conv_y", makeValidConv(dim_input_nodes, dim_emb, kernel_size)))
    , w1_(register_module("W1", torch::nn::Linear(dim_input_nodes, dim_emb)))
    , w2_(register_module("W2", torch::nn::Linear(dim_emb, dim_emb)))
{
}

torch::Tensor NeighborConvXYEmbeddingImpl::forward(const torch::Tensor& coords)
{
    if (coords.size(-1) < 2)
        throw std::invalid_argument("convXY embedding needs at least two coordinates per node");

    auto node_embedding = w1_->forward(coords);
    auto windows = gatherNeighborWindows(coords, nb_neighbors_);
    auto conv_embedding = convolveWindows(conv_x_, sortWindows(windows, 0)) +
                          convolveWindows(conv_y_, sortWindows(windows, 1));
    return node_embedding + w2_->forward(conv_embedding);
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<NodeEmbeddingImpl> makeNodeEmbedding(const TspNetConfig& config)
{
    switch (config.embedding)
    {
    case EmbeddingKind::Linear:
        return std::make_shared<LinearEmbeddingImpl>(config.dim_input_nodes, config.dim_emb);
    case EmbeddingKind::NeighborConv:
        return std::make_shared<NeighborConvEmbeddingImpl>(config.nb_neighbors, config.kernel_size,
                                                           config.dim_emb, config.dim_input_nodes);
    case EmbeddingKind::ConvSamePadding:
        return std::make_shared<ConvSamePaddingEmbeddingImpl>(config.dim_input_nodes, config.dim_emb,
                                                              config.kernel_size);
    case EmbeddingKind::ConvLinear:
        return std::make_shared<ConvLinearEmbeddingImpl>(config.dim_input_nodes, config.dim_emb,
                                                         config.kernel_size);
    case EmbeddingKind::NeighborConvXY:
        return std::make_shared<NeighborConvXYEmbeddingImpl>(config.nb_neighbors, config.kernel_size,
                                                             config.dim_emb, config.dim_input_nodes);
    }
    throw std::invalid_argument("Unsupported embedding kind");
}

} // namespace tsp
