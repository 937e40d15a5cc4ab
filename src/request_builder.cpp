#include "request_builder.hpp"

EngineParams build_params(const TranscriptionRequest& request) {
    switch (request.engine_kind) {
        case EngineKind::Whisper:
            return EngineParams{
                .model = WhisperModelParams{.use_gpu = true},
                .inference = InferenceParams{.language = request.language},
            };
        case EngineKind::Parakeet:
            return EngineParams{
                .model = ParakeetModelParams{.quantization = Quantization::Int8},
                .inference = InferenceParams{},
            };
    }
    return {};
}
