#pragma once

#include "engine/engine.hpp"
#include "envelope.hpp"
#include "request.hpp"

#include <string>

struct PipelineOptions {
    bool validate_paths = true;
    bool verbose = false;
};

// validate -> build params -> load_model -> transcribe, stopping at the
// first failure.
class Pipeline {
public:
    Pipeline(Engine& engine, PipelineOptions options);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    Envelope run(const TranscriptionRequest& request);

private:
    void log(const std::string& msg);

    Engine& engine_;
    PipelineOptions options_;
};
