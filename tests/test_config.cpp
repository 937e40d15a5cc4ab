#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "tc_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

// Points XDG_CONFIG_HOME somewhere for the lifetime of the object.
struct ScopedConfigHome {
    std::string old_value;
    bool had_value = false;

    explicit ScopedConfigHome(const std::string& dir) {
        if (const char* v = std::getenv("XDG_CONFIG_HOME")) {
            old_value = v;
            had_value = true;
        }
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }

    ~ScopedConfigHome() {
        if (had_value) {
            setenv("XDG_CONFIG_HOME", old_value.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
    }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.engine == "whisper");
        REQUIRE(cfg.language.empty());
        REQUIRE(cfg.validate_paths);
        REQUIRE(cfg.threads >= 1);
        REQUIRE(cfg.threads <= 4);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "engine": "parakeet",
            "language": "de",
            "validate_paths": false,
            "threads": 8
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->engine == "parakeet");
        REQUIRE(cfg->language == "de");
        REQUIRE_FALSE(cfg->validate_paths);
        REQUIRE(cfg->threads == 8);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "language": "fr" })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg->engine == "whisper");
        REQUIRE(cfg->validate_paths);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().starts_with("config: "));
    }

    SECTION("LoadWrongType") {
        TmpFile f(R"({ "threads": "many" })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
    }

    SECTION("LoadFractionalThreads") {
        TmpFile f(R"({ "threads": 2.5 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error() == "config: " + f.path + ": threads must be an integer");
    }

    SECTION("LoadHugeFloatThreads") {
        TmpFile f(R"({ "threads": 1e20 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().ends_with("threads must be an integer"));
    }

    SECTION("LoadHugeIntegerThreads") {
        TmpFile f(R"({ "threads": 4294967296 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().ends_with("threads is out of range"));
    }

    SECTION("LoadNegativeThreads") {
        TmpFile f(R"({ "threads": -3 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().ends_with("threads must be at least 1"));
    }

    SECTION("LoadZeroThreads") {
        TmpFile f(R"({ "threads": 0 })");

        auto cfg = Config::load(f.path);
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error().ends_with("threads must be at least 1"));
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/tc_test_nonexistent_config_file.json");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(cfg.error() == "config: could not open /tmp/tc_test_nonexistent_config_file.json");
    }

    SECTION("DefaultFileAbsent") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("tc_test_xdg_empty_" + std::to_string(getpid()));
        ScopedConfigHome home(dir.string());

        auto cfg = Config::load_default();
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->engine == "whisper");
    }

    SECTION("DefaultFilePresent") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("tc_test_xdg_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir / "transcribe-cli");
        {
            std::ofstream f(dir / "transcribe-cli" / "config.json");
            f << R"({ "engine": "parakeet" })";
        }
        ScopedConfigHome home(dir.string());

        auto cfg = Config::load_default();
        std::filesystem::remove_all(dir);
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->engine == "parakeet");
    }
}
