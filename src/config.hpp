#pragma once

#include <expected>
#include <string>

struct Config {
    std::string engine = "whisper"; // "whisper" or "parakeet"
    std::string language;            // empty = auto-detect
    bool validate_paths = true;
    int threads = default_threads();

    static int default_threads();

    // An explicitly named file must exist and parse.
    static std::expected<Config, std::string> load(const std::string& path);
    // The per-user file is optional; defaults are returned when it is absent.
    static std::expected<Config, std::string> load_default();
};
