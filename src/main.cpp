#include "cli.hpp"
#include "config.hpp"
#include "engine/engine.hpp"
#include "envelope.hpp"
#include "pipeline.hpp"

#include <cstdio>
#include <print>

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        return emit(Failure{args.error()}, stdout, stderr);
    }

    if (args->help) {
        print_usage(stdout, argv[0]);
        return 0;
    }

    auto config = args->config_path.empty() ? Config::load_default()
                                            : Config::load(args->config_path);
    if (!config) {
        return emit(Failure{config.error()}, stdout, stderr);
    }

    auto invocation = resolve(*args, *config);
    if (!invocation) {
        return emit(Failure{invocation.error()}, stdout, stderr);
    }

    if (args->verbose) {
        std::println(stderr, "[transcribe-cli] Starting (engine: {}, threads: {}, path check: {})",
                     engine_kind_name(invocation->request.engine_kind),
                     invocation->engine.n_threads,
                     invocation->pipeline.validate_paths ? "on" : "off");
    }

    auto engine = make_engine(invocation->request.engine_kind, invocation->engine);
    Pipeline pipeline(*engine, invocation->pipeline);
    return emit(pipeline.run(invocation->request), stdout, stderr);
}
