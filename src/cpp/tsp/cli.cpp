#include "cli.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace tsp
{

namespace
{

bool starts_with_flag(const std::string& value)
{
    return value.rfind("--", 0) == 0;
}

bool parse_bool(const std::string& value, const std::string& name)
{
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on")
    {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off")
    {
        return false;
    }
    throw std::invalid_argument("Failed to parse boolean value for " + name + ": " + value);
}

int64_t parse_int(const std::string& value, const std::string& name)
{
    try
    {
        size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size())
        {
            throw std::invalid_argument(value);
        }
        return parsed;
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument("Failed to parse integer value for " + name + ": " + value);
    }
}

} // namespace

std::string usage()
{
    return "Usage: tsp_demo [--config <file.json>] [--nodes N] [--batch B] [--beam-width W]\n"
           "                [--mode greedy|beamsearch|both] [--sample] [--seed S] [--cpu]\n";
}

DemoOptions parse_cli(int argc, char** argv)
{
    static const std::unordered_set<std::string> known = {
        "config", "nodes", "batch", "beam-width", "mode", "sample", "seed", "cpu"};

    std::unordered_map<std::string, std::string> flags;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (!starts_with_flag(arg))
        {
            throw std::invalid_argument("Unexpected positional argument: " + arg);
        }

        std::string key = arg.substr(2);
        if (key.empty())
        {
            throw std::invalid_argument("Empty flag encountered.");
        }
        if (known.count(key) == 0)
        {
            throw std::invalid_argument("Unknown flag: --" + key);
        }

        std::string value;
        if (i + 1 < argc && !starts_with_flag(argv[i + 1]))
        {
            value = argv[++i];
        }
        else
        {
            value = "true";
        }

        flags[key] = value;
    }

    auto lookup = [&](const std::string& name) -> std::optional<std::string> {
        auto it = flags.find(name);
        if (it != flags.end())
        {
            return it->second;
        }
        return std::nullopt;
    };

    DemoOptions options;

    if (auto config = lookup("config"))
    {
        options.config_path = *config;
    }
    if (auto nodes = lookup("nodes"))
    {
        options.nb_nodes = parse_int(*nodes, "--nodes");
    }
    if (auto batch = lookup("batch"))
    {
        options.batch_size = parse_int(*batch, "--batch");
    }
    if (auto width = lookup("beam-width"))
    {
        options.beam_width = parse_int(*width, "--beam-width");
    }
    if (auto mode = lookup("mode"))
    {
        options.mode = parseDecodeMode(*mode);
    }
    if (auto sample = lookup("sample"))
    {
        options.sample = parse_bool(*sample, "--sample");
    }
    if (auto seed = lookup("seed"))
    {
        options.seed = parse_int(*seed, "--seed");
    }
    if (auto cpu = lookup("cpu"))
    {
        options.force_cpu = parse_bool(*cpu, "--cpu");
    }

    if (options.nb_nodes <= 0)
    {
        throw std::invalid_argument("--nodes must be positive");
    }
    if (options.batch_size <= 0)
    {
        throw std::invalid_argument("--batch must be positive");
    }
    if (options.beam_width <= 0)
    {
        throw std::invalid_argument("--beam-width must be positive");
    }

    return options;
}

} // namespace tsp
