#include "request.hpp"

std::string_view engine_kind_name(EngineKind kind) {
    switch (kind) {
        case EngineKind::Whisper:
            return "whisper";
        case EngineKind::Parakeet:
            return "parakeet";
    }
    return "unknown";
}

std::expected<EngineKind, std::string> parse_engine_kind(std::string_view name) {
    if (name == "whisper") return EngineKind::Whisper;
    if (name == "parakeet") return EngineKind::Parakeet;
    return std::unexpected("unknown engine: " + std::string(name) +
                           " (expected whisper or parakeet)");
}
