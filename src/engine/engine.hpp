#pragma once

#include "../request.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

enum class EngineState { Uninitialized, Ready, Failed };

// A speech-to-text engine. load_model must succeed before transcribe is
// called; the caller owns that ordering.
class Engine {
public:
    virtual ~Engine() = default;

    virtual std::expected<void, std::string>
        load_model(const std::filesystem::path& model_path, const ModelParams& params) = 0;

    virtual std::expected<TranscriptionResult, std::string>
        transcribe(const std::filesystem::path& audio_path, const InferenceParams& params) = 0;

    virtual EngineState state() const = 0;
};

struct EngineOptions {
    int n_threads = 4;
    bool verbose = false;
};

std::unique_ptr<Engine> make_engine(EngineKind kind, const EngineOptions& options);
