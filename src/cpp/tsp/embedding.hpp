#pragma once

#include <cstdint>
#include <memory>

#include <torch/torch.h>

#include "config.hpp"

namespace tsp
{

/// Maps node coordinates [bsz, N, dim_input] to one dim_emb vector per node, order preserved.
class NodeEmbeddingImpl : public torch::nn::Module
{
public:
    ~NodeEmbeddingImpl() override = default;

    virtual torch::Tensor forward(const torch::Tensor& coords) = 0;
};

/// Direct linear projection of each coordinate.
class LinearEmbeddingImpl : public NodeEmbeddingImpl
{
public:
    LinearEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb);

    torch::Tensor forward(const torch::Tensor& coords) override;

private:
    torch::nn::Linear proj_{nullptr};
};

/// Linear projection of the node plus a valid convolution over its k-nearest-neighbour
/// window (node itself included), projected again by W2.
class NeighborConvEmbeddingImpl : public NodeEmbeddingImpl
{
public:
    NeighborConvEmbeddingImpl(int64_t nb_neighbors, int64_t kernel_size,
                              int64_t dim_emb, int64_t dim_input_nodes);

    torch::Tensor forward(const torch::Tensor& coords) override;

private:
    int64_t nb_neighbors_;
    torch::nn::Conv1d conv_{nullptr};
    torch::nn::Linear w1_{nullptr};
    torch::nn::Linear w2_{nullptr};
};

/// Same-padding convolution along the node sequence.
class ConvSamePaddingEmbeddingImpl : public NodeEmbeddingImpl
{
public:
    ConvSamePaddingEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb, int64_t kernel_size);

    torch::Tensor forward(const torch::Tensor& coords) override;

private:
    torch::nn::Conv1d conv_{nullptr};
};

/// Same-padding convolution along the node sequence plus a linear projection.
class ConvLinearEmbeddingImpl : public NodeEmbeddingImpl
{
public:
    ConvLinearEmbeddingImpl(int64_t dim_input_nodes, int64_t dim_emb, int64_t kernel_size);

    torch::Tensor forward(const torch::Tensor& coords) override;

private:
    torch::nn::Conv1d conv_{nullptr};
    torch::nn::Linear w1_{nullptr};
};

/// Neighbour convolution applied twice, once to the window sorted by x and once sorted
/// by y, the two results summed.
class NeighborConvXYEmbeddingImpl : public NodeEmbeddingImpl
{
public:
    NeighborConvXYEmbeddingImpl(int64_t nb_neighbors, int64_t kernel_size,
                                int64_t dim_emb, int64_t dim_input_nodes);

    torch::Tensor forward(const torch::Tensor& coords) override;

private:
    int64_t nb_neighbors_;
    torch::nn::Conv1d conv_x_{nullptr};
    torch::nn::Conv1d conv_y_{nullptr};
    torch::nn::Linear w1_{nullptr};
    torch::nn::Linear w2_{nullptr};
};

/// Gather the k+1 nearest nodes of every node (itself included), farthest first.
/// coords: [bsz, N, D] -> [bsz, N, k+1, D]
torch::Tensor gatherNeighborWindows(const torch::Tensor& coords, int64_t nb_neighbors);

/// Build the embedding selected by config.embedding.
std::shared_ptr<NodeEmbeddingImpl> makeNodeEmbedding(const TspNetConfig& config);

} // namespace tsp
