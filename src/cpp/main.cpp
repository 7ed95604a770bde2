#include <chrono>
#include <iomanip>
#include <iostream>
#include <string_view>
#include <variant>

#include <torch/torch.h>

#include "tsp/cli.hpp"
#include "tsp/tour_length.hpp"
#include "tsp/tsp_net.hpp"

namespace
{

void print_summary(std::string_view label, const torch::Tensor& coords,
                   const torch::Tensor& tours, const torch::Tensor& scores)
{
    auto lengths = tsp::computeTourLength(coords, tours);
    std::cout << label << " mean tour length: " << lengths.mean().item<double>()
              << ", mean log-prob: " << scores.mean().item<double>() << '\n';
}

void print_result(const tsp::DecodeResult& result, const torch::Tensor& coords)
{
    auto print_beams = [&](const tsp::BeamSearchResult& beams)
    {
        print_summary("[beamsearch]", coords, beams.tours, beams.scores);
        auto shortest = tsp::shortestBeamTours(coords, beams.beam_tours);
        std::cout << "[beamsearch] mean shortest-of-" << beams.beam_tours.size(1)
                  << " length: " << shortest.lengths.mean().item<double>() << '\n';
    };

    if (const auto* greedy = std::get_if<tsp::GreedyResult>(&result))
    {
        print_summary("[greedy]", coords, greedy->tours, greedy->scores);
    }
    else if (const auto* beams = std::get_if<tsp::BeamSearchResult>(&result))
    {
        print_beams(*beams);
    }
    else
    {
        const auto& both = std::get<tsp::CombinedResult>(result);
        print_summary("[greedy]", coords, both.greedy.tours, both.greedy.scores);
        print_beams(both.beam_search);
    }
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        auto options = tsp::parse_cli(argc, argv);

        auto config = options.config_path.empty() ? tsp::TspNetConfig{} : tsp::loadConfig(options.config_path);

        torch::manual_seed(static_cast<uint64_t>(options.seed));
        const bool use_cuda = !options.force_cpu && torch::cuda::is_available();
        const torch::Device device = use_cuda ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);

        tsp::TSPNet model(config);
        model->to(device);
        model->eval();

        // Uniform random instances in the unit square.
        auto coords = torch::rand({options.batch_size, options.nb_nodes, config.dim_input_nodes},
                                  torch::TensorOptions().device(device));

        tsp::DecodeOptions decode;
        decode.mode = options.mode;
        decode.beam_width = options.beam_width;
        decode.deterministic = !options.sample;

        std::cout << "[Demo] " << options.batch_size << " instances of " << options.nb_nodes
                  << " nodes on " << (use_cuda ? "CUDA" : "CPU") << ", mode=" << tsp::decodeModeName(options.mode)
                  << ", beam width " << options.beam_width << std::endl;

        torch::NoGradGuard no_grad;
        auto start = std::chrono::steady_clock::now();
        auto result = model->forward(coords, decode);
        if (use_cuda)
            torch::cuda::synchronize();
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();

        std::cout << std::fixed << std::setprecision(4);
        print_result(result, coords);
        std::cout << "[Demo] decode time: " << std::setprecision(1) << elapsed << " ms" << std::endl;
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << '\n' << tsp::usage();
        return 1;
    }
}
