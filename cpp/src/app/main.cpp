// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Конфигурация: YAML файл, затем флаги CLI, затем проверка
// 4. Прогон pipeline с флагом отмены от SIGINT/SIGTERM
// 5. PipelineError → problem JSON в stderr и код завершения
//
// ==============================================================================

#include "chatx/cli.hpp"
#include "chatx/config.hpp"
#include "chatx/output.hpp"
#include "chatx/pipeline.hpp"
#include "chatx/platform.hpp"
#include "chatx/problem.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <signal.h>

namespace {

std::atomic<bool> g_cancel{false};

void on_signal(int) {
    g_cancel.store(true);
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

constexpr const char* BANNER = R"(
      _           _
  ___| |__   __ _| |___  __
 / __| '_ \ / _` | __\ \/ /
| (__| | | | (_| | |_ >  <
 \___|_| |_|\__,_|\__/_/\_\
)";

void print_banner(chatx::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(chatx::output::Stream::Stderr, BANNER);
    writer.write_line(chatx::output::Stream::Stderr, "");
}

/// Problem JSON одной строкой в stderr
int report_problem(chatx::output::Writer& writer, const chatx::Problem& problem) {
    writer.write_line(chatx::output::Stream::Stderr, problem.to_json());
    return chatx::exit_code_for(problem.code);
}

// ----------------------------------------------------------------------------
// extract
// ----------------------------------------------------------------------------

int run_extract(const chatx::cli::ExtractCommand& cmd, chatx::output::Writer& writer) {
    using namespace chatx;

    config::ExtractConfig cfg;
    if (cmd.config) {
        config::LoadResult loaded = config::load_file(*cmd.config);
        if (!loaded.ok) {
            return report_problem(writer, make_problem(ErrorCode::ConfigInvalid,
                                                       loaded.error.format(),
                                                       platform::path_to_utf8(*cmd.config)));
        }
        cfg = std::move(loaded.config);
    }
    cli::apply_overrides(cmd, cfg);
    if (auto error = config::validate(cfg)) {
        return report_problem(writer, make_problem(ErrorCode::ConfigInvalid, error->format()));
    }

    install_signal_handlers();
    try {
        pipeline::RunResult result = pipeline::run(cfg, writer, &g_cancel);
        result.report.print_summary(writer);
        writer.info("Wrote " + std::to_string(result.report.counters.messages_emitted) +
                    " message(s) to " +
                    platform::redact_path(platform::path_to_utf8(result.out_dir)));
        return 0;
    } catch (const PipelineError& e) {
        return report_problem(writer, e.problem());
    }
}

int run(int argc, char** argv) {
    using namespace chatx;

    cli::ParseResult parsed = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parsed.global.quiet;
    out_cfg.verbose = parsed.global.verbose;
    out_cfg.no_banner = parsed.global.no_banner;
    output::Writer writer(out_cfg);

    if (!parsed.ok) {
        writer.write(output::Stream::Stderr, parsed.diagnostic.stderr_message);
        return parsed.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_extract(cmd, writer);
            }
        },
        parsed.command);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Непредвиденная ошибка: формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
