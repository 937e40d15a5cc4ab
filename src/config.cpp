#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <cstdint>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

int Config::default_threads() {
    int hw = static_cast<int>(std::thread::hardware_concurrency());
    return std::clamp(hw, 1, 4);
}

std::expected<Config, std::string> Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        return std::unexpected("config: could not open " + path);
    }

    try {
        auto j = json::parse(f);
        if (!j.is_object()) {
            return std::unexpected("config: " + path + ": expected a JSON object");
        }

        if (j.contains("engine")) cfg.engine = j["engine"].get<std::string>();
        if (j.contains("language")) cfg.language = j["language"].get<std::string>();
        if (j.contains("validate_paths")) cfg.validate_paths = j["validate_paths"].get<bool>();
        if (j.contains("threads")) {
            const auto& threads = j["threads"];
            if (!threads.is_number_integer()) {
                return std::unexpected("config: " + path + ": threads must be an integer");
            }
            constexpr int64_t max_threads = std::numeric_limits<int>::max();
            bool too_large = threads.is_number_unsigned()
                                 ? threads.get<uint64_t>() > static_cast<uint64_t>(max_threads)
                                 : threads.get<int64_t>() > max_threads;
            if (too_large) {
                return std::unexpected("config: " + path + ": threads is out of range");
            }
            cfg.threads = threads.get<int>();
        }

    } catch (const json::exception& e) {
        return std::unexpected("config: " + path + ": " + e.what());
    }

    if (cfg.threads < 1) {
        return std::unexpected("config: " + path + ": threads must be at least 1");
    }

    return cfg;
}

std::expected<Config, std::string> Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        return load(config_path.string());
    }
    return Config{};
}
