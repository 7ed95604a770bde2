#include "tour_length.hpp"

#include <stdexcept>
#include <string>
#include <tuple>

namespace tsp
{

torch::Tensor computeTourLength(const torch::Tensor& coords, const torch::Tensor& tour)
{
    torch::NoGradGuard no_grad;

    if (coords.dim() != 3)
        throw std::invalid_argument("Coordinates must be [bsz, nb_nodes, dim]");
    if (tour.dim() != 2 || tour.size(1) < 1)
        throw std::invalid_argument("Tour must be [bsz, tour_len] with tour_len >= 1");
    if (tour.size(0) != coords.size(0))
    {
        throw std::invalid_argument("Tour batch size " + std::to_string(tour.size(0)) +
                                    " does not match coordinate batch size " + std::to_string(coords.size(0)));
    }

    auto idx = tour.to(coords.device(), torch::kLong).unsqueeze(2).expand({tour.size(0), tour.size(1), coords.size(2)});
    auto ordered = coords.gather(1, idx);
    auto next = ordered.roll(-1, 1);
    return (ordered - next).norm(2, -1).sum(1);
}

torch::Tensor computeBeamTourLengths(const torch::Tensor& coords, const torch::Tensor& beam_tours)
{
    if (beam_tours.dim() != 3)
        throw std::invalid_argument("Beam tours must be [bsz, width, tour_len]");
    if (coords.dim() != 3 || beam_tours.size(0) != coords.size(0))
        throw std::invalid_argument("Beam tours and coordinates disagree on the batch size");

    const auto bsz = beam_tours.size(0);
    const auto width = beam_tours.size(1);
    auto lengths = computeTourLength(coords.repeat_interleave(width, 0),
                                     beam_tours.reshape({bsz * width, beam_tours.size(2)}));
    return lengths.view({bsz, width});
}

ShortestTours shortestBeamTours(const torch::Tensor& coords, const torch::Tensor& beam_tours)
{
    auto lengths = computeBeamTourLengths(coords, beam_tours);

    ShortestTours best;
    std::tie(best.lengths, best.beam) = lengths.min(1);
    auto batch = torch::arange(beam_tours.size(0), best.beam.options());
    best.tours = beam_tours.index({batch, best.beam.to(beam_tours.device())});
    return best;
}

} // namespace tsp
