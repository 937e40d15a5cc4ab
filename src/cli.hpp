#pragma once

#include "config.hpp"
#include "engine/engine.hpp"
#include "pipeline.hpp"
#include "request.hpp"

#include <cstdio>
#include <expected>
#include <optional>
#include <string>

struct CliArgs {
    std::string audio;
    std::string model;
    std::optional<std::string> language;
    std::optional<std::string> engine;
    std::optional<int> threads;
    std::string config_path;
    bool skip_path_check = false;
    bool verbose = false;
    bool help = false;
};

// Everything main needs for one run.
struct Invocation {
    TranscriptionRequest request;
    PipelineOptions pipeline;
    EngineOptions engine;
};

std::expected<CliArgs, std::string> parse_args(int argc, const char* const argv[]);

// Command line wins over config file values.
std::expected<Invocation, std::string> resolve(const CliArgs& args, const Config& config);

void print_usage(std::FILE* out, const char* prog);
