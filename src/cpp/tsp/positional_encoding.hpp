#pragma once

#include <cstdint>

#include <torch/torch.h>

namespace tsp
{

/// Standard transformer sinusoidal table [max_len, d_model]:
/// even columns sin(pos / 10000^(2i/d)), odd columns cos of the same angle.
torch::Tensor sinusoidalPositionalEncoding(int64_t d_model, int64_t max_len);

} // namespace tsp
