#pragma once

#include <cstdint>
#include <string>

#include "tsp_net.hpp"

namespace tsp
{

struct DemoOptions
{
    std::string config_path;  // empty: built-in defaults
    int64_t nb_nodes{50};
    int64_t batch_size{16};
    int64_t beam_width{10};
    DecodeMode mode{DecodeMode::Both};
    bool sample{false};
    int64_t seed{1234};
    bool force_cpu{false};
};

/// Parse `--flag value` pairs; a flag without a value reads as "true".
/// Throws std::invalid_argument on unknown flags or malformed values.
DemoOptions parse_cli(int argc, char** argv);

std::string usage();

} // namespace tsp
