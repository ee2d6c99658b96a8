#include <benchmark/benchmark.h>

#include "medley/cli/app.hpp"
#include "medley/cli/commands.hpp"
#include "medley/cli/options.hpp"

static void BM_CliParseGlobalOptions(benchmark::State& state) {
    medley::cli::u32 count = 0;
    const medley::cli::OptionSpec* specs = medley::cli::global_option_specs(&count);

    const char* argv[] = {"--strict", "--data-root", "/srv/medley", "--user=123", "-ldebug", "--", "libs"};
    const medley::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        medley::cli::ParsedOption buf[8]{};
        medley::cli::ParsedOptions out{buf, 0, 8};
        medley::cli::u32 consumed = 0;
        const medley::core::Status s = medley::cli::parse_options(args, specs, count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<medley::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseGlobalOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    medley::cli::u32 count = 0;
    const medley::cli::CommandSpec* specs = medley::cli::default_commands(&count);

    // Near the end of the table.
    const char* argv[] = {"mirror-rm-library", "3"};
    const medley::cli::CliArgs args{argv, 2};
    for (auto _ : state) {
        medley::cli::CommandInvocation out{};
        medley::cli::u32 consumed = 0;
        const medley::core::Status s = medley::cli::parse_command(args, specs, count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<medley::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<medley::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
