#include "positional_encoding.hpp"

#include <cmath>
#include <stdexcept>

namespace tsp
{

torch::Tensor sinusoidalPositionalEncoding(int64_t d_model, int64_t max_len)
{
    if (d_model <= 0 || max_len <= 0)
        throw std::invalid_argument("Positional encoding needs positive d_model and max_len");

    using namespace torch::indexing;
    auto pe = torch::zeros({max_len, d_model}, torch::kFloat32);
    auto position = torch::arange(0, max_len, torch::kFloat32).unsqueeze(1);
    auto div_term = torch::exp(torch::arange(0, d_model, 2, torch::kFloat32) *
                               (-std::log(10000.0) / static_cast<double>(d_model)));
    auto angle = position * div_term;  // [max_len, ceil(d_model / 2)]

    pe.index_put_({Slice(), Slice(0, None, 2)}, torch::sin(angle));
    // Odd d_model has one fewer cosine column than sine columns.
    const auto n_cos = d_model / 2;
    pe.index_put_({Slice(), Slice(1, None, 2)}, torch::cos(angle.narrow(1, 0, n_cos)));
    return pe;
}

} // namespace tsp
