#include "config.hpp"

#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace tsp
{

namespace
{

// Minimal readers for flat JSON configs: locate "key", skip to the value after ':'.
// Returns npos when the key is absent.
size_t findJsonValue(const std::string& json, const std::string& key)
{
    std::string search = "\"" + key + "\"";
    size_t pos = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        throw std::runtime_error("Malformed config entry: " + key);
    pos++;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    return pos;
}

bool isJsonNull(const std::string& json, size_t pos)
{
    return json.compare(pos, 4, "null") == 0;
}

std::optional<int64_t> readJsonInt(const std::string& json, const std::string& key)
{
    size_t pos = findJsonValue(json, key);
    if (pos == std::string::npos || isJsonNull(json, pos))
        return std::nullopt;
    size_t end = pos;
    if (end < json.size() && json[end] == '-') end++;
    while (end < json.size() && std::isdigit(static_cast<unsigned char>(json[end]))) end++;
    if (end == pos)
        throw std::runtime_error("Expected integer for config key: " + key);
    return std::stoll(json.substr(pos, end - pos));
}

std::optional<double> readJsonDouble(const std::string& json, const std::string& key)
{
    size_t pos = findJsonValue(json, key);
    if (pos == std::string::npos || isJsonNull(json, pos))
        return std::nullopt;
    size_t end = pos;
    while (end < json.size() &&
           (std::isdigit(static_cast<unsigned char>(json[end])) || json[end] == '-' ||
            json[end] == '+' || json[end] == '.' || json[end] == 'e' || json[end] == 'E'))
        end++;
    if (end == pos)
        throw std::runtime_error("Expected number for config key: " + key);
    return std::stod(json.substr(pos, end - pos));
}

std::optional<bool> readJsonBool(const std::string& json, const std::string& key)
{
    size_t pos = findJsonValue(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    throw std::runtime_error("Expected boolean for config key: " + key);
}

std::optional<std::string> readJsonString(const std::string& json, const std::string& key)
{
    size_t pos = findJsonValue(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json[pos] != '"')
        throw std::runtime_error("Expected string for config key: " + key);
    size_t end = json.find('"', pos + 1);
    if (end == std::string::npos)
        throw std::runtime_error("Unterminated string for config key: " + key);
    return json.substr(pos + 1, end - pos - 1);
}

void requirePositive(int64_t value, const char* name)
{
    if (value <= 0)
        throw std::invalid_argument(std::string(name) + " must be positive, got " + std::to_string(value));
}

bool usesNeighborWindow(EmbeddingKind kind)
{
    return kind == EmbeddingKind::NeighborConv || kind == EmbeddingKind::NeighborConvXY;
}

bool usesConvolution(EmbeddingKind kind)
{
    return kind != EmbeddingKind::Linear;
}

} // anonymous namespace

EmbeddingKind parseEmbeddingKind(const std::string& name)
{
    if (name == "linear") return EmbeddingKind::Linear;
    if (name == "conv") return EmbeddingKind::NeighborConv;
    if (name == "conv_same_padding") return EmbeddingKind::ConvSamePadding;
    if (name == "conv_linear") return EmbeddingKind::ConvLinear;
    if (name == "convXY") return EmbeddingKind::NeighborConvXY;
    throw std::invalid_argument("Unknown embedding: " + name);
}

const char* embeddingKindName(EmbeddingKind kind)
{
    switch (kind)
    {
    case EmbeddingKind::Linear: return "linear";
    case EmbeddingKind::NeighborConv: return "conv";
    case EmbeddingKind::ConvSamePadding: return "conv_same_padding";
    case EmbeddingKind::ConvLinear: return "conv_linear";
    case EmbeddingKind::NeighborConvXY: return "convXY";
    }
    return "unknown";
}

void validateConfig(const TspNetConfig& config)
{
    requirePositive(config.dim_input_nodes, "dim_input_nodes");
    requirePositive(config.dim_emb, "dim_emb");
    requirePositive(config.dim_ff, "dim_ff");
    requirePositive(config.nb_layers_encoder, "nb_layers_encoder");
    requirePositive(config.nb_layers_decoder, "nb_layers_decoder");
    requirePositive(config.nb_heads, "nb_heads");
    requirePositive(config.max_len_pe, "max_len_pe");

    if (config.dim_emb % config.nb_heads != 0)
    {
        throw std::invalid_argument("dim_emb (" + std::to_string(config.dim_emb) +
                                    ") must be divisible by nb_heads (" +
                                    std::to_string(config.nb_heads) + ")");
    }
    if (config.segm_len && *config.segm_len <= 0)
        throw std::invalid_argument("segm_len must be positive when set");

    if (usesConvolution(config.embedding))
        requirePositive(config.kernel_size, "kernel_size");

    // A valid convolution over the K+1 neighbour window must collapse it to one vector.
    if (usesNeighborWindow(config.embedding))
    {
        requirePositive(config.nb_neighbors, "nb_neighbors");
        if (config.kernel_size != config.nb_neighbors + 1)
        {
            throw std::invalid_argument("kernel_size (" + std::to_string(config.kernel_size) +
                                        ") must equal nb_neighbors + 1 (" +
                                        std::to_string(config.nb_neighbors + 1) + ") for " +
                                        embeddingKindName(config.embedding) + " embedding");
        }
    }
}

TspNetConfig parseConfig(const std::string& config_json)
{
    TspNetConfig config;

    if (auto embedding = readJsonString(config_json, "embedding"))
        config.embedding = parseEmbeddingKind(*embedding);
    if (auto v = readJsonInt(config_json, "nb_neighbors")) config.nb_neighbors = *v;
    if (auto v = readJsonInt(config_json, "kernel_size")) config.kernel_size = *v;
    if (auto v = readJsonInt(config_json, "dim_input_nodes")) config.dim_input_nodes = *v;
    if (auto v = readJsonInt(config_json, "dim_emb")) config.dim_emb = *v;
    if (auto v = readJsonInt(config_json, "dim_ff")) config.dim_ff = *v;
    if (auto v = readJsonInt(config_json, "nb_layers_encoder")) config.nb_layers_encoder = *v;
    if (auto v = readJsonInt(config_json, "nb_layers_decoder")) config.nb_layers_decoder = *v;
    if (auto v = readJsonInt(config_json, "nb_heads")) config.nb_heads = *v;
    if (auto v = readJsonInt(config_json, "max_len_pe")) config.max_len_pe = *v;
    config.segm_len = readJsonInt(config_json, "segm_len");
    if (auto v = readJsonBool(config_json, "batchnorm")) config.batchnorm = *v;
    if (auto v = readJsonDouble(config_json, "final_clip_value")) config.final_clip_value = *v;
    if (auto v = readJsonBool(config_json, "verbose")) config.verbose = *v;

    return config;
}

TspNetConfig loadConfig(const std::string& config_path)
{
    std::ifstream cf(config_path);
    if (!cf) throw std::runtime_error("Failed to open config: " + config_path);
    std::string config_json((std::istreambuf_iterator<char>(cf)), std::istreambuf_iterator<char>());
    return parseConfig(config_json);
}

} // namespace tsp
