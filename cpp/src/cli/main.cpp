#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "medley/cli/app.hpp"
#include "medley/cli/commands.hpp"
#include "medley/cli/options.hpp"
#include "medley/core/config.hpp"
#include "medley/core/errors.hpp"
#include "medley/core/log.hpp"

namespace {

    volatile std::sig_atomic_t g_running = 1;

    void sigint_handler(int /*sig*/) {
        g_running = 0;
    }

    // Whitespace-separated tokens; no quoting.
    std::vector<std::string> split_line(const std::string& line) {
        std::vector<std::string> tokens;
        std::string cur;
        for (char c : line) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (!cur.empty()) {
                    tokens.push_back(std::move(cur));
                    cur.clear();
                }
            } else {
                cur.push_back(c);
            }
        }
        if (!cur.empty()) {
            tokens.push_back(std::move(cur));
        }
        return tokens;
    }

    int dispatch(medley::cli::App& app, const medley::cli::CliArgs& args) {
        medley::core::u32 count = 0;
        const medley::cli::CommandSpec* specs = medley::cli::default_commands(&count);

        medley::cli::CommandInvocation cmd;
        medley::core::u32 consumed = 0;
        const medley::core::Status s = medley::cli::parse_command(args, specs, count, &cmd, &consumed);
        if (!medley::core::is_ok(s)) {
            std::fprintf(stderr, "error: unknown command '%s' (try 'help')\n", args.argv[0]);
            return medley::cli::kExitUsage;
        }
        return app.run(cmd);
    }

    // Interactive mode when no command is given on the command line.
    int repl(medley::cli::App& app) {
        std::printf("medley - interactive mode, 'help' for commands, 'q' to quit\n");
        std::string line;
        while (g_running) {
            std::printf("medley> ");
            std::fflush(stdout);
            if (!std::getline(std::cin, line)) {
                break;
            }

            const std::vector<std::string> tokens = split_line(line);
            if (tokens.empty()) {
                continue;
            }
            if (tokens[0] == "q" || tokens[0] == "quit" || tokens[0] == "exit") {
                break;
            }

            std::vector<const char*> argv;
            argv.reserve(tokens.size());
            for (const std::string& t : tokens) {
                argv.push_back(t.c_str());
            }
            (void)dispatch(app, medley::cli::CliArgs{argv.data(), static_cast<medley::core::u32>(argv.size())});
        }
        std::printf("bye\n");
        return medley::cli::kExitOk;
    }

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, sigint_handler);

    medley::cli::AppOptions opts;
    medley::core::Status s = medley::core::load_config_from_env(&opts.config);
    if (!medley::core::is_ok(s)) {
        std::fprintf(stderr, "error: bad MEDLEY_* environment (%s)\n", medley::core::describe(s).c_str());
        return medley::cli::kExitUsage;
    }

    const medley::cli::CliArgs all{argv + 1, argc > 0 ? static_cast<medley::core::u32>(argc - 1) : 0};

    medley::core::u32 spec_count = 0;
    const medley::cli::OptionSpec* specs = medley::cli::global_option_specs(&spec_count);
    medley::cli::ParsedOption storage[16]{};
    medley::cli::ParsedOptions parsed{storage, 0, 16};
    medley::core::u32 consumed = 0;
    s = medley::cli::parse_options(all, specs, spec_count, &parsed, &consumed);
    if (medley::core::is_ok(s)) {
        s = medley::cli::apply_global_options(parsed, &opts);
    }
    if (!medley::core::is_ok(s)) {
        std::fprintf(stderr, "error: bad global options; usage: medley [-d dir] [-b db] [-u user] [-s] <command> ...\n");
        return medley::cli::kExitUsage;
    }

    medley::core::log_init(opts.config.log_level);

    medley::cli::App app(opts, stdout);
    s = app.open();
    if (!medley::core::is_ok(s)) {
        medley::core::logger()->critical("cannot open catalog: {}", medley::core::describe(s));
        return medley::cli::kExitError;
    }

    const medley::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (rest.argc == 0) {
        return repl(app);
    }
    return dispatch(app, rest);
}
