#pragma once

#include "request.hpp"

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

struct PathCheck {
    std::string label;
    std::filesystem::path path;
};

// Checks each path in order and stops at the first one that does not exist,
// failing with "<label> file not found: <path>".
std::expected<void, std::string> validate_paths(std::span<const PathCheck> checks);

// Model before audio.
std::vector<PathCheck> required_paths(const TranscriptionRequest& request);
