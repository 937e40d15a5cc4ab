#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

enum class EngineKind { Whisper, Parakeet };

std::string_view engine_kind_name(EngineKind kind);
std::expected<EngineKind, std::string> parse_engine_kind(std::string_view name);

struct TranscriptionRequest {
    std::filesystem::path audio_path;
    std::filesystem::path model_path;
    EngineKind engine_kind = EngineKind::Whisper;
    std::optional<std::string> language;
};

struct WhisperModelParams {
    bool use_gpu = true;
};

enum class Quantization { Int8 };

struct ParakeetModelParams {
    Quantization quantization = Quantization::Int8;
};

// Each alternative belongs to exactly one engine kind.
using ModelParams = std::variant<WhisperModelParams, ParakeetModelParams>;

struct InferenceParams {
    // Absent means auto-detect.
    std::optional<std::string> language;
};

struct TranscriptionResult {
    std::string text;
};
