#pragma once

#include "engine.hpp"

struct whisper_context;

// General engine: a single GGML model file run through whisper.cpp.
class WhisperEngine : public Engine {
public:
    explicit WhisperEngine(EngineOptions options);
    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    std::expected<void, std::string>
        load_model(const std::filesystem::path& model_path, const ModelParams& params) override;

    std::expected<TranscriptionResult, std::string>
        transcribe(const std::filesystem::path& audio_path, const InferenceParams& params) override;

    EngineState state() const override { return state_; }

private:
    EngineOptions options_;
    whisper_context* ctx_ = nullptr;
    EngineState state_ = EngineState::Uninitialized;
};
