#include "whisper_engine.hpp"
#include "../text.hpp"
#include "../wav.hpp"

#include <cstdio>
#include <whisper.h>

namespace {

void quiet_log(enum ggml_log_level /*level*/, const char* /*text*/, void* /*user_data*/) {}

void stderr_log(enum ggml_log_level /*level*/, const char* text, void* /*user_data*/) {
    std::fputs(text, stderr);
}

} // namespace

WhisperEngine::WhisperEngine(EngineOptions options) : options_(options) {
    // whisper.cpp and ggml write progress to stderr, which would break the
    // single-line error contract.
    whisper_log_set(options_.verbose ? stderr_log : quiet_log, nullptr);
}

WhisperEngine::~WhisperEngine() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<void, std::string>
WhisperEngine::load_model(const std::filesystem::path& model_path, const ModelParams& params) {
    const auto& whisper_params = std::get<WhisperModelParams>(params);

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = whisper_params.use_gpu;

    // Reloading replaces the previous model, even when the new one fails.
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        state_ = EngineState::Failed;
        return std::unexpected("failed to load whisper model: " + model_path.string());
    }

    state_ = EngineState::Ready;
    return {};
}

std::expected<TranscriptionResult, std::string>
WhisperEngine::transcribe(const std::filesystem::path& audio_path, const InferenceParams& params) {
    auto samples = wav::read_file(audio_path);
    if (!samples) {
        return std::unexpected(samples.error());
    }
    auto pcm = wav::to_float(*samples);

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.n_threads = options_.n_threads;
    wparams.language = params.language ? params.language->c_str() : "auto";
    wparams.translate = false;
    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.print_special = false;

    int rc = whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (rc != 0) {
        return std::unexpected("whisper_full failed with code " + std::to_string(rc));
    }

    std::string joined;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        joined += whisper_full_get_segment_text(ctx_, i);
    }

    return TranscriptionResult{.text = text::trim(joined)};
}
