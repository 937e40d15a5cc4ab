#include "cli.hpp"

#include <charconv>
#include <print>

void print_usage(std::FILE* out, const char* prog) {
    std::println(out, "Usage: {} --audio PATH --model PATH [options]", prog);
    std::println(out, "Transcribe a 16 kHz 16-bit mono WAV file.");
    std::println(out, "Options:");
    std::println(out, "  --audio PATH          WAV file to transcribe");
    std::println(out, "  --model PATH          Model file (whisper) or model directory (parakeet)");
    std::println(out, "  --language CODE       Language code, e.g. en (default: auto-detect;");
    std::println(out, "                        parakeet always auto-detects and ignores this)");
    std::println(out, "  --engine NAME         whisper or parakeet (default: whisper)");
    std::println(out, "  --threads N           Engine worker threads");
    std::println(out, "  -c, --config PATH     Config file path");
    std::println(out, "  --skip-path-check     Do not check that --model and --audio exist");
    std::println(out, "  -v, --verbose         Enable verbose logging");
    std::println(out, "  -h, --help            Show this help");
    std::println(out, "Output: {{\"text\":...}} on stdout (exit 0) or {{\"error\":...}} on stderr (exit 1)");
}

std::expected<CliArgs, std::string> parse_args(int argc, const char* const argv[]) {
    CliArgs args;
    bool have_audio = false;
    bool have_model = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= argc) return std::unexpected("missing value for " + arg);
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (arg == "--skip-path-check") {
            args.skip_path_check = true;
        } else if (arg == "--audio") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.audio = *v;
            have_audio = true;
        } else if (arg == "--model") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.model = *v;
            have_model = true;
        } else if (arg == "--language") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.language = *v;
        } else if (arg == "--engine") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.engine = *v;
        } else if (arg == "--config" || arg == "-c") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            args.config_path = *v;
        } else if (arg == "--threads") {
            auto v = value();
            if (!v) return std::unexpected(v.error());
            int n = 0;
            auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
            if (ec != std::errc() || ptr != v->data() + v->size() || n < 1) {
                return std::unexpected("invalid value for --threads: " + *v);
            }
            args.threads = n;
        } else {
            return std::unexpected("unknown argument: " + arg);
        }
    }

    if (args.help) return args;

    if (!have_audio) return std::unexpected("missing required argument: --audio");
    if (!have_model) return std::unexpected("missing required argument: --model");

    return args;
}

std::expected<Invocation, std::string> resolve(const CliArgs& args, const Config& config) {
    auto kind = parse_engine_kind(args.engine.value_or(config.engine));
    if (!kind) return std::unexpected(kind.error());

    std::optional<std::string> language = args.language;
    if (!language && !config.language.empty()) {
        language = config.language;
    }

    return Invocation{
        .request = TranscriptionRequest{
            .audio_path = args.audio,
            .model_path = args.model,
            .engine_kind = *kind,
            .language = std::move(language),
        },
        .pipeline = PipelineOptions{
            .validate_paths = config.validate_paths && !args.skip_path_check,
            .verbose = args.verbose,
        },
        .engine = EngineOptions{
            .n_threads = args.threads.value_or(config.threads),
            .verbose = args.verbose,
        },
    };
}
