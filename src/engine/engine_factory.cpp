#include "engine.hpp"
#include "parakeet_engine.hpp"
#include "whisper_engine.hpp"

std::unique_ptr<Engine> make_engine(EngineKind kind, const EngineOptions& options) {
    switch (kind) {
        case EngineKind::Whisper:
            return std::make_unique<WhisperEngine>(options);
        case EngineKind::Parakeet:
            return std::make_unique<ParakeetEngine>(options);
    }
    return nullptr;
}
