#pragma once

#include "request.hpp"

struct EngineParams {
    ModelParams model;
    InferenceParams inference;
};

// Whisper: GPU on, language passed through. Parakeet: int8, language
// dropped because the model always auto-detects.
EngineParams build_params(const TranscriptionRequest& request);
