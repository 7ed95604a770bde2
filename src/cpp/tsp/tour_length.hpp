#pragma once

#include <torch/torch.h>

namespace tsp
{

/// Closed-cycle Euclidean length of each tour, return edge included.
/// coords: [bsz, N, 2], tour: int64 [bsz, N] -> [bsz]. No gradient is tracked.
torch::Tensor computeTourLength(const torch::Tensor& coords, const torch::Tensor& tour);

/// Lengths of every final beam. beam_tours: int64 [bsz, width, N] -> [bsz, width]
torch::Tensor computeBeamTourLengths(const torch::Tensor& coords, const torch::Tensor& beam_tours);

struct ShortestTours
{
    torch::Tensor tours;    // int64 [bsz, N]
    torch::Tensor lengths;  // [bsz]
    torch::Tensor beam;     // int64 [bsz], index of the chosen beam
};

/// Pick the geometrically shortest beam per batch row (not necessarily beam 0).
ShortestTours shortestBeamTours(const torch::Tensor& coords, const torch::Tensor& beam_tours);

} // namespace tsp
