#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tsp
{

enum class EmbeddingKind
{
    Linear,           // "linear"
    NeighborConv,     // "conv"
    ConvSamePadding,  // "conv_same_padding"
    ConvLinear,       // "conv_linear"
    NeighborConvXY,   // "convXY"
};

/// Construction-time options of the TSP network.
struct TspNetConfig
{
    EmbeddingKind embedding{EmbeddingKind::Linear};
    int64_t nb_neighbors{10};
    int64_t kernel_size{11};
    int64_t dim_input_nodes{2};
    int64_t dim_emb{128};
    int64_t dim_ff{512};
    int64_t nb_layers_encoder{6};
    int64_t nb_layers_decoder{2};
    int64_t nb_heads{8};
    int64_t max_len_pe{1000};
    std::optional<int64_t> segm_len;  // self-attention sliding window, unbounded when empty
    bool batchnorm{true};             // encoder normalization: batch-style or layer-style
    double final_clip_value{10.0};
    bool verbose{true};
};

/// Parse an embedding name ("linear", "conv", "conv_same_padding", "conv_linear", "convXY").
EmbeddingKind parseEmbeddingKind(const std::string& name);
const char* embeddingKindName(EmbeddingKind kind);

/// Throws std::invalid_argument on any inconsistent option.
void validateConfig(const TspNetConfig& config);

/// Read a flat JSON config file. Keys absent from the file keep their defaults.
TspNetConfig loadConfig(const std::string& config_path);

/// Same as loadConfig, from the JSON text itself.
TspNetConfig parseConfig(const std::string& config_json);

} // namespace tsp
