#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "tsp/tour_length.hpp"
#include "tsp/tsp_net.hpp"

namespace py = pybind11;

namespace
{

using Instances = std::vector<std::vector<std::vector<double>>>;

torch::Tensor to_tensor(const Instances& coords)
{
    if (coords.empty() || coords.front().empty())
    {
        throw std::invalid_argument("coords must be a non-empty [bsz][nb_nodes][dim] list");
    }
    const auto bsz = static_cast<int64_t>(coords.size());
    const auto nb_nodes = static_cast<int64_t>(coords.front().size());
    const auto dim = static_cast<int64_t>(coords.front().front().size());

    std::vector<float> flat;
    flat.reserve(static_cast<size_t>(bsz * nb_nodes * dim));
    for (const auto& instance : coords)
    {
        if (static_cast<int64_t>(instance.size()) != nb_nodes)
        {
            throw std::invalid_argument("All instances must have the same number of nodes");
        }
        for (const auto& point : instance)
        {
            if (static_cast<int64_t>(point.size()) != dim)
            {
                throw std::invalid_argument("All points must have the same dimension");
            }
            flat.insert(flat.end(), point.begin(), point.end());
        }
    }
    return torch::from_blob(flat.data(), {bsz, nb_nodes, dim}, torch::kFloat32).clone();
}

py::list tours_to_python(const torch::Tensor& tours)
{
    auto cpu = tours.to(torch::kCPU, torch::kLong).contiguous();
    py::list result;
    for (int64_t b = 0; b < cpu.size(0); b++)
    {
        auto row = cpu[b];
        const auto* data = row.data_ptr<int64_t>();
        result.append(std::vector<int64_t>(data, data + row.numel()));
    }
    return result;
}

std::vector<double> values_to_python(const torch::Tensor& values)
{
    auto cpu = values.to(torch::kCPU, torch::kDouble).contiguous();
    const auto* data = cpu.data_ptr<double>();
    return std::vector<double>(data, data + cpu.numel());
}

py::dict greedy_to_python(const tsp::GreedyResult& result, const torch::Tensor& coords)
{
    py::dict d;
    d["tours"] = tours_to_python(result.tours);
    d["scores"] = values_to_python(result.scores);
    d["lengths"] = values_to_python(tsp::computeTourLength(coords, result.tours));
    return d;
}

py::dict beams_to_python(const tsp::BeamSearchResult& result, const torch::Tensor& coords)
{
    py::dict d;
    d["tours"] = tours_to_python(result.tours);
    d["scores"] = values_to_python(result.scores);
    d["lengths"] = values_to_python(tsp::computeTourLength(coords, result.tours));

    auto shortest = tsp::shortestBeamTours(coords, result.beam_tours);
    d["shortest_tours"] = tours_to_python(shortest.tours);
    d["shortest_lengths"] = values_to_python(shortest.lengths);
    d["beam_width"] = result.beam_tours.size(1);
    return d;
}

/// Owns one network; every solve() call decodes with fresh sessions.
class TourSolver
{
public:
    explicit TourSolver(const std::string& config_path)
        : model_(config_path.empty() ? tsp::TspNetConfig{} : tsp::loadConfig(config_path))
    {
        model_->eval();
    }

    py::dict solve(const Instances& coords, int64_t beam_width, const std::string& mode, bool sample)
    {
        auto x = to_tensor(coords);
        tsp::DecodeOptions options;
        options.mode = tsp::parseDecodeMode(mode);
        options.beam_width = beam_width;
        options.deterministic = !sample;

        tsp::DecodeResult result;
        {
            py::gil_scoped_release release;
            torch::NoGradGuard no_grad;
            result = model_->forward(x, options);
        }

        py::dict out;
        if (const auto* greedy = std::get_if<tsp::GreedyResult>(&result))
        {
            out["greedy"] = greedy_to_python(*greedy, x);
        }
        else if (const auto* beams = std::get_if<tsp::BeamSearchResult>(&result))
        {
            out["beamsearch"] = beams_to_python(*beams, x);
        }
        else
        {
            const auto& both = std::get<tsp::CombinedResult>(result);
            out["greedy"] = greedy_to_python(both.greedy, x);
            out["beamsearch"] = beams_to_python(both.beam_search, x);
        }
        return out;
    }

    void load_state(const std::string& path)
    {
        torch::load(model_, path);
        model_->eval();
    }

    void save_state(const std::string& path)
    {
        torch::save(model_, path);
    }

private:
    tsp::TSPNet model_;
};

} // namespace

PYBIND11_MODULE(_tsp_transformer_cpp, m)
{
    py::class_<TourSolver>(m, "TourSolver")
        .def(py::init<const std::string&>(), py::arg("config_path") = std::string(),
             "Build a network from a JSON config (built-in defaults when empty).")
        .def("solve", &TourSolver::solve,
             py::arg("coords"),
             py::arg("beam_width") = 1,
             py::arg("mode") = std::string("greedy"),
             py::arg("sample") = false,
             "Decode [bsz][nb_nodes][2] coordinates; returns a dict keyed by mode with tours, scores and lengths.")
        .def("load_state", &TourSolver::load_state, py::arg("path"),
             "Load parameters saved with torch::save.")
        .def("save_state", &TourSolver::save_state, py::arg("path"));

    m.def(
        "tour_length",
        [](const Instances& coords, const std::vector<std::vector<int64_t>>& tours) {
            auto x = to_tensor(coords);
            if (tours.size() != static_cast<size_t>(x.size(0)) || tours.front().empty())
            {
                throw std::invalid_argument("tours must be a [bsz][tour_len] list matching coords");
            }
            const auto len = static_cast<int64_t>(tours.front().size());
            auto t = torch::empty({x.size(0), len}, torch::kLong);
            for (int64_t b = 0; b < x.size(0); b++)
            {
                if (static_cast<int64_t>(tours[b].size()) != len)
                {
                    throw std::invalid_argument("All tours must have the same length");
                }
                for (int64_t i = 0; i < len; i++)
                {
                    t[b][i] = tours[b][i];
                }
            }
            return values_to_python(tsp::computeTourLength(x, t));
        },
        py::arg("coords"),
        py::arg("tours"),
        "Closed-cycle Euclidean tour lengths.");
}
