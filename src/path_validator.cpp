#include "path_validator.hpp"

std::expected<void, std::string> validate_paths(std::span<const PathCheck> checks) {
    for (const auto& check : checks) {
        // An unreadable parent directory counts as missing.
        std::error_code ec;
        if (!std::filesystem::exists(check.path, ec)) {
            return std::unexpected(check.label + " file not found: " + check.path.string());
        }
    }
    return {};
}

std::vector<PathCheck> required_paths(const TranscriptionRequest& request) {
    return {
        {"Model", request.model_path},
        {"Audio", request.audio_path},
    };
}
