#include "pipeline.hpp"

#include "path_validator.hpp"
#include "request_builder.hpp"

#include <chrono>
#include <format>
#include <print>

Pipeline::Pipeline(Engine& engine, PipelineOptions options)
    : engine_(engine), options_(options) {}

Envelope Pipeline::run(const TranscriptionRequest& request) {
    if (options_.validate_paths) {
        auto checks = required_paths(request);
        if (auto valid = validate_paths(checks); !valid) {
            return Failure{valid.error()};
        }
    }

    auto params = build_params(request);
    if (request.engine_kind == EngineKind::Parakeet && request.language) {
        log("parakeet auto-detects the language, ignoring --language " + *request.language);
    }

    log(std::format("Loading {} model from {}", engine_kind_name(request.engine_kind),
                    request.model_path.string()));
    auto start = std::chrono::steady_clock::now();

    if (auto loaded = engine_.load_model(request.model_path, params.model); !loaded) {
        return Failure{loaded.error()};
    }

    auto loaded_at = std::chrono::steady_clock::now();
    log(std::format("Model loaded in {:.2f}s, transcribing {}",
                    std::chrono::duration<double>(loaded_at - start).count(),
                    request.audio_path.string()));

    auto result = engine_.transcribe(request.audio_path, params.inference);
    if (!result) {
        return Failure{result.error()};
    }

    auto end = std::chrono::steady_clock::now();
    log(std::format("Transcribed in {:.2f}s ({} chars)",
                    std::chrono::duration<double>(end - loaded_at).count(),
                    result->text.size()));

    return Success{std::move(result->text)};
}

void Pipeline::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[transcribe-cli] {}", msg);
    }
}
